/*
* Copyright (c) 2024, The Dragoman Project
*
* This file is part of Dragoman project and licensed under BSD3
*
* See full license text in LICENSE file at top of project tree
*/

#include <cctype>
#include <charconv>
#include "Error.h"
#include "Plural.h"
#include "Formatter.h"

namespace dragoman
{
	static std::string_view TrimName (std::string_view s)
	{
		while (!s.empty () && std::isspace ((unsigned char)s.front ())) s.remove_prefix (1);
		while (!s.empty () && std::isspace ((unsigned char)s.back ())) s.remove_suffix (1);
		return s;
	}

	static bool IsIndex (std::string_view name, size_t& index)
	{
		if (name.empty ()) return false;
		for (auto c: name)
			if (!std::isdigit ((unsigned char)c)) return false;
		auto res = std::from_chars (name.data (), name.data () + name.size (), index);
		return res.ec == std::errc ();
	}

	std::string Interpolate (std::string_view text, const Context& context)
	{
		std::string out;
		out.reserve (text.size ());
		size_t autoIndex = 0, i = 0;
		while (i < text.size ())
		{
			char c = text[i];
			if (c == '}')
			{
				out += '}';
				i += (i + 1 < text.size () && text[i + 1] == '}') ? 2 : 1;
				continue;
			}
			if (c != '{')
			{
				out += c;
				i++;
				continue;
			}
			if (i + 1 < text.size () && text[i + 1] == '{')
			{
				out += '{';
				i += 2;
				continue;
			}
			auto end = text.find_first_of ("{}", i + 1);
			if (end == std::string_view::npos || text[end] == '{')
			{
				// unterminated, keep the brace as text
				out += '{';
				i++;
				continue;
			}

			auto name = TrimName (text.substr (i + 1, end - i - 1));
			std::optional<Value> value;
			size_t index = 0;
			if (name.empty ())
			{
				if (auto v = context.Get (autoIndex)) value = *v;
				autoIndex++;
			}
			else if (name == "?")
				value = context.GetCount ();
			else if (IsIndex (name, index))
			{
				if (auto v = context.Get (index)) value = *v;
			}
			else if (auto v = context.Get (name))
				value = *v;

			if (value)
				out += value->ToString ();
			else
				out.append (text.substr (i, end - i + 1));
			i = end + 1;
		}
		return out;
	}

	std::string DefaultFormatter::Format (const Locale&, const std::string& message, const Context& context) const
	{
		auto t = ParseTemplate (message);
		if (!t.IsPlural ())
			return Interpolate (t.GetDefault (), context);

		auto count = context.GetCount ();
		if (!count)
			throw MissingPluralContext (message);
		return Interpolate (t.Select (count->ToInteger ()), context);
	}
}
