/*
* Copyright (c) 2024, The Dragoman Project
*
* This file is part of Dragoman project and licensed under BSD3
*
* See full license text in LICENSE file at top of project tree
*/

#include <cctype>
#include <charconv>
#include <algorithm>
#include "Error.h"
#include "Plural.h"

namespace dragoman
{
	static std::string_view Trim (std::string_view s)
	{
		while (!s.empty () && std::isspace ((unsigned char)s.front ())) s.remove_prefix (1);
		while (!s.empty () && std::isspace ((unsigned char)s.back ())) s.remove_suffix (1);
		return s;
	}

	static bool ParseInt (std::string_view s, int64_t& n)
	{
		s = Trim (s);
		if (s.empty ()) return false;
		auto res = std::from_chars (s.data (), s.data () + s.size (), n);
		return res.ec == std::errc () && res.ptr == s.data () + s.size ();
	}

	PluralRule PluralRule::Match (std::vector<int64_t> values)
	{
		PluralRule r (eRuleMatch);
		r.m_Values = std::move (values);
		return r;
	}

	PluralRule PluralRule::Range (int64_t from, int64_t to)
	{
		PluralRule r (eRuleRange);
		r.m_From = from; r.m_To = to;
		return r;
	}

	PluralRule PluralRule::RangeFrom (int64_t from)
	{
		PluralRule r (eRuleRangeFrom);
		r.m_From = from;
		return r;
	}

	PluralRule PluralRule::RangeTo (int64_t to)
	{
		PluralRule r (eRuleRangeTo);
		r.m_To = to;
		return r;
	}

	bool PluralRule::Matches (int64_t n) const
	{
		switch (m_Type)
		{
			case eRuleMatch:
				return std::find (m_Values.begin (), m_Values.end (), n) != m_Values.end ();
			case eRuleRange:
				return n >= m_From && n <= m_To;
			case eRuleRangeFrom:
				return n >= m_From;
			case eRuleRangeTo:
				return n <= m_To;
		}
		return false;
	}

	std::string PluralRule::ToString () const
	{
		std::string s = "{";
		switch (m_Type)
		{
			case eRuleMatch:
				for (size_t i = 0; i < m_Values.size (); i++)
				{
					if (i) s += ", ";
					s += std::to_string (m_Values[i]);
				}
			break;
			case eRuleRange:
				s += std::to_string (m_From) + ".." + std::to_string (m_To);
			break;
			case eRuleRangeFrom:
				s += std::to_string (m_From) + "..";
			break;
			case eRuleRangeTo:
				s += ".." + std::to_string (m_To);
			break;
		}
		s += "}";
		return s;
	}

	static std::optional<PluralRule> ParseRule (std::string_view rule, std::string& error)
	{
		auto sep = rule.find ("..");
		if (sep != std::string_view::npos)
		{
			auto from = rule.substr (0, sep), to = rule.substr (sep + 2);
			int64_t f = 0, t = 0;
			if (Trim (from).empty ())
			{
				if (!ParseInt (to, t))
				{
					error = "failed to parse 'to' value in range-to rule";
					return std::nullopt;
				}
				return PluralRule::RangeTo (t);
			}
			if (Trim (to).empty ())
			{
				if (!ParseInt (from, f))
				{
					error = "failed to parse 'from' value in range-from rule";
					return std::nullopt;
				}
				return PluralRule::RangeFrom (f);
			}
			if (!ParseInt (from, f))
				error = "failed to parse 'from' value in range rule";
			else if (!ParseInt (to, t))
				error = "failed to parse 'to' value in range rule";
			else if (f > t)
				error = "empty range, 'from' is greater than 'to' in range rule";
			else
				return PluralRule::Range (f, t);
			return std::nullopt;
		}

		std::vector<int64_t> values;
		size_t pos = 0;
		for (;;)
		{
			auto comma = rule.find (',', pos);
			auto value = rule.substr (pos, comma == std::string_view::npos ? std::string_view::npos : comma - pos);
			int64_t n = 0;
			if (!ParseInt (value, n))
			{
				error = "failed to parse value '" + std::string (Trim (value)) + "' in match rule";
				return std::nullopt;
			}
			values.push_back (n);
			if (comma == std::string_view::npos) break;
			pos = comma + 1;
		}
		return PluralRule::Match (std::move (values));
	}

	PluralRule ParsePluralRule (std::string_view rule, std::string_view branch)
	{
		std::string error;
		auto r = ParseRule (rule, error);
		if (!r)
			throw TemplateError (std::string (branch), error + " for '" + std::string (branch) + "'");
		return *r;
	}

	// split on single '|', a run of 2k pipes is k literal pipes, an odd run ends with a separator
	static std::vector<std::string> SplitBranches (std::string_view message)
	{
		std::vector<std::string> branches (1);
		size_t i = 0;
		while (i < message.size ())
		{
			if (message[i] != PLURAL_SEPARATOR)
			{
				branches.back () += message[i];
				i++;
				continue;
			}
			size_t run = 0;
			while (i < message.size () && message[i] == PLURAL_SEPARATOR) { run++; i++; }
			branches.back ().append (run / 2, PLURAL_SEPARATOR);
			if (run & 1)
				branches.emplace_back ();
		}
		return branches;
	}

	Template ParseTemplate (std::string_view message)
	{
		Template t;
		auto branches = SplitBranches (message);
		if (branches.size () == 1)
		{
			t.m_Default = std::move (branches[0]);
			return t;
		}

		for (size_t i = 0; i + 1 < branches.size (); i++)
		{
			auto branch = Trim (branches[i]);
			if (branch.empty () || branch[0] != '{')
				throw TemplateError (std::string (message), "failed to parse rule for '" + std::string (branch) + "', expected '{'");
			auto end = branch.find ('}');
			if (end == std::string_view::npos)
				throw TemplateError (std::string (message), "failed to parse rule for '" + std::string (branch) +
					"', expected '}' but string was terminated");
			std::string error;
			auto rule = ParseRule (branch.substr (1, end - 1), error);
			if (!rule)
				throw TemplateError (std::string (message), error + " for '" + std::string (branch) + "'");
			t.m_Branches.push_back ({ *rule, std::string (Trim (branch.substr (end + 1))) });
		}

		// the last branch must not carry a guard, a leading placeholder such as {?} is fine
		auto last = Trim (branches.back ());
		if (!last.empty () && last[0] == '{')
		{
			auto end = last.find ('}');
			std::string error;
			if (end != std::string_view::npos && ParseRule (last.substr (1, end - 1), error))
				throw TemplateError (std::string (message), "pluralized message has no default branch, '" +
					std::string (last) + "' is guarded");
		}
		t.m_Default = std::string (last);
		return t;
	}

	const std::string& Template::Select (std::optional<int64_t> count) const
	{
		if (count)
			for (const auto& it: m_Branches)
				if (it.rule.Matches (*count)) return it.text;
		return m_Default;
	}
}
