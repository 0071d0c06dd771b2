/*
* Copyright (c) 2024, The Dragoman Project
*
* This file is part of Dragoman project and licensed under BSD3
*
* See full license text in LICENSE file at top of project tree
*/

#include "Catalogue.h"

namespace dragoman
{
	std::optional<std::string> Catalogue::Insert (const std::string& domain, const std::string& id, const std::string& message)
	{
		auto& messages = m_Messages[domain];
		auto it = messages.find (id);
		if (it != messages.end ())
		{
			auto prev = std::move (it->second);
			it->second = message;
			return prev;
		}
		messages.emplace (id, message);
		return std::nullopt;
	}

	std::optional<std::string> Catalogue::Remove (const std::string& domain, const std::string& id)
	{
		auto it = m_Messages.find (domain);
		if (it == m_Messages.end ()) return std::nullopt;
		auto it1 = it->second.find (id);
		if (it1 == it->second.end ()) return std::nullopt;
		auto prev = std::move (it1->second);
		it->second.erase (it1);
		return prev;
	}

	std::optional<Messages> Catalogue::RemoveAll (const std::string& domain)
	{
		auto it = m_Messages.find (domain);
		if (it == m_Messages.end ()) return std::nullopt;
		auto messages = std::move (it->second);
		m_Messages.erase (it);
		return messages;
	}

	const std::string * Catalogue::Get (const std::string& domain, const std::string& id) const
	{
		auto it = m_Messages.find (domain);
		if (it == m_Messages.end ()) return nullptr;
		auto it1 = it->second.find (id);
		return it1 != it->second.end () ? &it1->second : nullptr;
	}

	const Messages * Catalogue::GetAll (const std::string& domain) const
	{
		auto it = m_Messages.find (domain);
		return it != m_Messages.end () ? &it->second : nullptr;
	}

	std::vector<std::string> Catalogue::GetDomains () const
	{
		std::vector<std::string> domains;
		for (const auto& it: m_Messages)
			domains.push_back (it.first);
		return domains;
	}

	size_t Catalogue::GetNumMessages () const
	{
		size_t num = 0;
		for (const auto& it: m_Messages)
			num += it.second.size ();
		return num;
	}

	void Catalogue::Merge (const Catalogue& other)
	{
		for (const auto& domain: other.m_Messages)
		{
			auto& messages = m_Messages[domain.first];
			for (const auto& it: domain.second)
				messages[it.first] = it.second;
		}
	}

	CatalogueBag::CatalogueBag (std::vector<Catalogue> catalogues)
	{
		for (auto& it: catalogues)
			Insert (std::move (it));
	}

	void CatalogueBag::Insert (Catalogue catalogue)
	{
		auto it = m_Catalogues.find (catalogue.GetLocale ());
		if (it != m_Catalogues.end ())
			it->second.Merge (catalogue);
		else
		{
			auto locale = catalogue.GetLocale ();
			m_Catalogues.emplace (locale, std::move (catalogue));
		}
	}

	void CatalogueBag::Merge (const CatalogueBag& other)
	{
		for (const auto& it: other.m_Catalogues)
			Insert (it.second);
	}

	const Catalogue * CatalogueBag::Get (const Locale& locale) const
	{
		auto it = m_Catalogues.find (locale);
		return it != m_Catalogues.end () ? &it->second : nullptr;
	}

	std::vector<Locale> CatalogueBag::GetLocales () const
	{
		std::vector<Locale> locales;
		for (const auto& it: m_Catalogues)
			locales.push_back (it.first);
		return locales;
	}
}
