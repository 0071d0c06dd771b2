/*
* Copyright (c) 2024, The Dragoman Project
*
* This file is part of Dragoman project and licensed under BSD3
*
* See full license text in LICENSE file at top of project tree
*/

#ifndef ERROR_H__
#define ERROR_H__

#include <string>
#include <vector>
#include <stdexcept>
#include "Locale.h"

namespace dragoman
{
	/** base of every error reported by the library */
	class TranslationError: public std::runtime_error
	{
		public:

			explicit TranslationError (const std::string& what): std::runtime_error (what) {};
	};

	class LocaleParseError: public TranslationError
	{
		public:

			explicit LocaleParseError (const std::string& tag);
			const std::string& GetTag () const { return m_Tag; };

		private:

			std::string m_Tag;
	};

	class TemplateError: public TranslationError
	{
		public:

			TemplateError (const std::string& message, const std::string& reason);
			const std::string& GetTemplate () const { return m_Template; };
			const std::string& GetReason () const { return m_Reason; };

		private:

			std::string m_Template, m_Reason;
	};

	class MissingPluralContext: public TranslationError
	{
		public:

			explicit MissingPluralContext (const std::string& message);
			const std::string& GetTemplate () const { return m_Template; };

		private:

			std::string m_Template;
	};

	class MessageNotFound: public TranslationError
	{
		public:

			MessageNotFound (const std::string& domain, const std::string& id, const std::vector<Locale>& attempted);
			const std::string& GetDomain () const { return m_Domain; };
			const std::string& GetId () const { return m_Id; };
			const std::vector<Locale>& GetAttemptedLocales () const { return m_AttemptedLocales; };

		private:

			std::string m_Domain, m_Id;
			std::vector<Locale> m_AttemptedLocales;
	};

	/** catalogue directory or file can't be read */
	class LoaderError: public TranslationError
	{
		public:

			LoaderError (const std::string& path, const std::string& reason);
			const std::string& GetPath () const { return m_Path; };

		private:

			std::string m_Path;
	};
}

#endif
