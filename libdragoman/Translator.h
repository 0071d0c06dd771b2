/*
* Copyright (c) 2024, The Dragoman Project
*
* This file is part of Dragoman project and licensed under BSD3
*
* See full license text in LICENSE file at top of project tree
*/

#ifndef TRANSLATOR_H__
#define TRANSLATOR_H__

#include <inttypes.h>
#include <string>
#include <string_view>
#include <vector>
#include <memory>
#include <mutex>
#include <optional>
#include "Locale.h"
#include "Context.h"
#include "Catalogue.h"
#include "Formatter.h"

namespace dragoman
{
	struct TemplateIssue
	{
		Locale locale;
		std::string domain;
		std::string id;
		std::string reason;
	};

	/**
	 * @brief Resolves messages over a shared, read only catalogue bag
	 *
	 * Translate may be called from many threads at once. The fallback locale
	 * is the only mutable state and is guarded by its own mutex.
	 */
	class Translator
	{
		public:

			Translator (std::shared_ptr<const CatalogueBag> bag, std::optional<Locale> fallback = std::nullopt,
				std::shared_ptr<const Formatter> formatter = nullptr);
			Translator (CatalogueBag bag, std::optional<Locale> fallback = std::nullopt);

			/**
			 * @brief Resolve, select plural branch and interpolate
			 * @throws MessageNotFound, MissingPluralContext, TemplateError
			 */
			std::string Translate (const Locale& locale, const std::string& domain, const std::string& id,
				const Context& context = Context ()) const;
			std::string Translate (const Locale& locale, const std::string& domain, const std::string& id,
				int64_t count) const;
			/** @throws LocaleParseError before any lookup */
			std::string Translate (std::string_view tag, const std::string& domain, const std::string& id,
				const Context& context = Context ()) const;

			/** true if some locale of the fallback chain defines (domain, id) */
			bool Has (const Locale& locale, const std::string& domain, const std::string& id) const;

			/** locale, its parents, then the fallback locale if not already there */
			std::vector<Locale> GetFallbackChain (const Locale& locale) const;

			void SetFallbackLocale (std::optional<Locale> locale);
			std::optional<Locale> GetFallbackLocale () const;

			const CatalogueBag& GetCatalogueBag () const { return *m_Bag; };

			/** parse every template of the bag, report malformed ones */
			std::vector<TemplateIssue> Check () const;

		private:

			const std::string * Lookup (const std::vector<Locale>& chain, const std::string& domain,
				const std::string& id, const Locale *& found) const;

		private:

			std::shared_ptr<const CatalogueBag> m_Bag;
			std::shared_ptr<const Formatter> m_Formatter;
			std::optional<Locale> m_FallbackLocale;
			mutable std::mutex m_FallbackMutex;
	};
}

#endif
