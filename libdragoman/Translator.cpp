/*
* Copyright (c) 2024, The Dragoman Project
*
* This file is part of Dragoman project and licensed under BSD3
*
* See full license text in LICENSE file at top of project tree
*/

#include <algorithm>
#include "Log.h"
#include "Error.h"
#include "Plural.h"
#include "Translator.h"

namespace dragoman
{
	Translator::Translator (std::shared_ptr<const CatalogueBag> bag, std::optional<Locale> fallback,
		std::shared_ptr<const Formatter> formatter):
		m_Bag (bag ? bag : std::make_shared<const CatalogueBag> ()),
		m_Formatter (formatter ? formatter : std::make_shared<const DefaultFormatter> ()),
		m_FallbackLocale (fallback)
	{
	}

	Translator::Translator (CatalogueBag bag, std::optional<Locale> fallback):
		Translator (std::make_shared<const CatalogueBag> (std::move (bag)), fallback)
	{
	}

	std::vector<Locale> Translator::GetFallbackChain (const Locale& locale) const
	{
		auto chain = locale.GetFallbackChain ();
		auto fallback = GetFallbackLocale ();
		if (fallback && std::find (chain.begin (), chain.end (), *fallback) == chain.end ())
			chain.push_back (*fallback);
		return chain;
	}

	const std::string * Translator::Lookup (const std::vector<Locale>& chain, const std::string& domain,
		const std::string& id, const Locale *& found) const
	{
		for (const auto& locale: chain)
		{
			auto catalogue = m_Bag->Get (locale);
			if (!catalogue) continue;
			auto message = catalogue->Get (domain, id);
			if (message)
			{
				found = &locale;
				return message;
			}
		}
		return nullptr;
	}

	std::string Translator::Translate (const Locale& locale, const std::string& domain, const std::string& id,
		const Context& context) const
	{
		auto chain = GetFallbackChain (locale);
		const Locale * found = nullptr;
		auto message = Lookup (chain, domain, id, found);
		if (!message)
		{
			LogPrint (eLogDebug, "Translator: '", id, "' not found in '", domain, "' domain for ", locale);
			throw MessageNotFound (domain, id, chain);
		}
		if (*found != locale)
			LogPrint (eLogDebug, "Translator: '", id, "' in '", domain, "' domain resolved for ", *found, " instead of ", locale);

		try
		{
			return m_Formatter->Format (*found, *message, context);
		}
		catch (TemplateError& ex)
		{
			LogPrint (eLogDebug, "Translator: Malformed template '", id, "' in '", domain, "' domain for ", *found, ": ", ex.what ());
			throw;
		}
	}

	std::string Translator::Translate (const Locale& locale, const std::string& domain, const std::string& id,
		int64_t count) const
	{
		return Translate (locale, domain, id, Context ().SetCount (count));
	}

	std::string Translator::Translate (std::string_view tag, const std::string& domain, const std::string& id,
		const Context& context) const
	{
		return Translate (Locale::FromTag (tag), domain, id, context);
	}

	bool Translator::Has (const Locale& locale, const std::string& domain, const std::string& id) const
	{
		const Locale * found = nullptr;
		return Lookup (GetFallbackChain (locale), domain, id, found) != nullptr;
	}

	void Translator::SetFallbackLocale (std::optional<Locale> locale)
	{
		std::lock_guard<std::mutex> l(m_FallbackMutex);
		m_FallbackLocale = locale;
	}

	std::optional<Locale> Translator::GetFallbackLocale () const
	{
		std::lock_guard<std::mutex> l(m_FallbackMutex);
		return m_FallbackLocale;
	}

	std::vector<TemplateIssue> Translator::Check () const
	{
		std::vector<TemplateIssue> issues;
		for (const auto& catalogue: m_Bag->GetCatalogues ())
			for (const auto& domain: catalogue.second.GetMessages ())
				for (const auto& it: domain.second)
				{
					try
					{
						ParseTemplate (it.second);
					}
					catch (TemplateError& ex)
					{
						issues.push_back ({ catalogue.first, domain.first, it.first, ex.GetReason () });
					}
				}
		if (!issues.empty ())
			LogPrint (eLogDebug, "Translator: ", issues.size (), " malformed templates found");
		return issues;
	}
}
