/*
* Copyright (c) 2024, The Dragoman Project
*
* This file is part of Dragoman project and licensed under BSD3
*
* See full license text in LICENSE file at top of project tree
*/

#include <sstream>
#include "Error.h"

namespace dragoman
{
	LocaleParseError::LocaleParseError (const std::string& tag):
		TranslationError ("locale: invalid locale, expected a valid locale code but found '" + tag + "'"),
		m_Tag (tag)
	{
	}

	TemplateError::TemplateError (const std::string& message, const std::string& reason):
		TranslationError ("template: " + reason),
		m_Template (message), m_Reason (reason)
	{
	}

	MissingPluralContext::MissingPluralContext (const std::string& message):
		TranslationError ("template: pluralized message '" + message + "' requires a count, but none was given"),
		m_Template (message)
	{
	}

	static std::string FormatNotFound (const std::string& domain, const std::string& id,
		const std::vector<Locale>& attempted)
	{
		std::stringstream s;
		s << "message not found: message '" << id << "' could not be found in '" << domain << "' domain for locales";
		bool first = true;
		for (const auto& it: attempted)
		{
			s << (first ? " '" : ", '") << it << "'";
			first = false;
		}
		return s.str ();
	}

	MessageNotFound::MessageNotFound (const std::string& domain, const std::string& id,
		const std::vector<Locale>& attempted):
		TranslationError (FormatNotFound (domain, id, attempted)),
		m_Domain (domain), m_Id (id), m_AttemptedLocales (attempted)
	{
	}

	LoaderError::LoaderError (const std::string& path, const std::string& reason):
		TranslationError ("loader: " + reason + " (" + path + ")"),
		m_Path (path)
	{
	}
}
