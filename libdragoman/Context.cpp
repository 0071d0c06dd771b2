/*
* Copyright (c) 2024, The Dragoman Project
*
* This file is part of Dragoman project and licensed under BSD3
*
* See full license text in LICENSE file at top of project tree
*/

#include <cmath>
#include <limits>
#include <charconv>
#include "Context.h"

namespace dragoman
{
	std::string Value::ToString () const
	{
		if (auto s = std::get_if<std::string>(&m_Value))
			return *s;
		char buf[32];
		std::to_chars_result res;
		if (auto i = std::get_if<int64_t>(&m_Value))
			res = std::to_chars (buf, buf + sizeof (buf), *i);
		else
			res = std::to_chars (buf, buf + sizeof (buf), std::get<double>(m_Value)); // shortest round trip
		return std::string (buf, res.ptr);
	}

	std::optional<int64_t> Value::ToInteger () const
	{
		if (auto i = std::get_if<int64_t>(&m_Value))
			return *i;
		if (auto d = std::get_if<double>(&m_Value))
		{
			if (!std::isfinite (*d) || std::trunc (*d) != *d) return std::nullopt;
			// 2^63 itself is out of range
			if (*d < -9223372036854775808.0 || *d >= 9223372036854775808.0) return std::nullopt;
			return (int64_t)*d;
		}
		const auto& s = std::get<std::string>(m_Value);
		int64_t ret = 0;
		auto res = std::from_chars (s.data (), s.data () + s.size (), ret);
		if (res.ec != std::errc () || res.ptr != s.data () + s.size ())
			return std::nullopt;
		return ret;
	}

	Context::Context (std::initializer_list<Entry> values)
	{
		for (const auto& it: values)
			Set (it.first, it.second);
	}

	Context& Context::Set (const std::string& name, Value value)
	{
		for (auto& it: m_Values)
			if (it.first == name)
			{
				it.second = std::move (value);
				return *this;
			}
		m_Values.emplace_back (name, std::move (value));
		return *this;
	}

	const Value * Context::Get (std::string_view name) const
	{
		for (const auto& it: m_Values)
			if (it.first == name) return &it.second;
		return nullptr;
	}

	const Value * Context::Get (size_t index) const
	{
		return index < m_Values.size () ? &m_Values[index].second : nullptr;
	}

	std::optional<Value> Context::GetCount () const
	{
		if (m_Count) return Value (*m_Count);
		if (auto v = Get (COUNT_VALUE_NAME)) return *v;
		return std::nullopt;
	}

	bool Context::HasCount () const
	{
		return m_Count || Get (COUNT_VALUE_NAME);
	}
}
