/*
* Copyright (c) 2024, The Dragoman Project
*
* This file is part of Dragoman project and licensed under BSD3
*
* See full license text in LICENSE file at top of project tree
*/

#ifndef CATALOGUE_H__
#define CATALOGUE_H__

#include <map>
#include <string>
#include <vector>
#include <optional>
#include "Locale.h"

namespace dragoman
{
	typedef std::map<std::string, std::string> Messages; // id -> template
	typedef std::map<std::string, Messages> DomainMessages; // domain -> messages

	/**
	 * @brief Message templates of one locale, by domain and id
	 *
	 * No fallback logic here, that's the Translator's business.
	 */
	class Catalogue
	{
		public:

			Catalogue (const Locale& locale): m_Locale (locale) {};
			Catalogue (const Locale& locale, DomainMessages messages):
				m_Locale (locale), m_Messages (std::move (messages)) {};

			const Locale& GetLocale () const { return m_Locale; };

			/** @return previous template if (domain, id) was already defined */
			std::optional<std::string> Insert (const std::string& domain, const std::string& id, const std::string& message);
			std::optional<std::string> Remove (const std::string& domain, const std::string& id);
			std::optional<Messages> RemoveAll (const std::string& domain);

			/** @return template or nullptr */
			const std::string * Get (const std::string& domain, const std::string& id) const;
			const Messages * GetAll (const std::string& domain) const;
			std::vector<std::string> GetDomains () const; // sorted
			const DomainMessages& GetMessages () const { return m_Messages; };
			size_t GetNumMessages () const;
			bool IsEmpty () const { return m_Messages.empty (); };

			/** add every message of other, other wins on collision */
			void Merge (const Catalogue& other);

			bool operator== (const Catalogue& other) const { return m_Locale == other.m_Locale && m_Messages == other.m_Messages; };
			bool operator!= (const Catalogue& other) const { return !(*this == other); };

		private:

			Locale m_Locale;
			DomainMessages m_Messages;
	};

	/**
	 * @brief Catalogues keyed by locale, at most one per locale
	 */
	class CatalogueBag
	{
		public:

			CatalogueBag () = default;
			CatalogueBag (std::vector<Catalogue> catalogues);

			/** merge into the catalogue of the same locale if any, last write wins */
			void Insert (Catalogue catalogue);
			void Merge (const CatalogueBag& other);

			const Catalogue * Get (const Locale& locale) const;
			std::vector<Locale> GetLocales () const; // sorted
			const std::map<Locale, Catalogue>& GetCatalogues () const { return m_Catalogues; };
			size_t GetNumCatalogues () const { return m_Catalogues.size (); };
			bool IsEmpty () const { return m_Catalogues.empty (); };

			bool operator== (const CatalogueBag& other) const { return m_Catalogues == other.m_Catalogues; };
			bool operator!= (const CatalogueBag& other) const { return !(*this == other); };

		private:

			std::map<Locale, Catalogue> m_Catalogues;
	};
}

#endif
