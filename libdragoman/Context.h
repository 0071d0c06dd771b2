/*
* Copyright (c) 2024, The Dragoman Project
*
* This file is part of Dragoman project and licensed under BSD3
*
* See full license text in LICENSE file at top of project tree
*/

#ifndef CONTEXT_H__
#define CONTEXT_H__

#include <inttypes.h>
#include <string>
#include <string_view>
#include <vector>
#include <variant>
#include <optional>
#include <utility>
#include <type_traits>
#include <initializer_list>

namespace dragoman
{
	/**
	 * @brief Displayable value of a placeholder
	 *
	 * Rendering never depends on the process locale.
	 */
	class Value
	{
		public:

			Value (const std::string& s): m_Value (s) {};
			Value (std::string&& s): m_Value (std::move (s)) {};
			Value (const char * s): m_Value (std::string (s)) {};
			Value (std::string_view s): m_Value (std::string (s)) {};
			template<typename T, typename std::enable_if<std::is_integral<T>::value && !std::is_same<T, bool>::value, int>::type = 0>
			Value (T i): m_Value ((int64_t)i) {};
			Value (double d): m_Value (d) {};
			Value (float f): m_Value ((double)f) {};

			std::string ToString () const;

			/**
			 * @brief Integral form used for plural guards
			 * @return nothing for non numeric strings, fractional or non finite doubles
			 */
			std::optional<int64_t> ToInteger () const;

			bool operator== (const Value& other) const { return m_Value == other.m_Value; };
			bool operator!= (const Value& other) const { return m_Value != other.m_Value; };

		private:

			std::variant<std::string, int64_t, double> m_Value;
	};

	/**
	 * @brief Values of one translation call
	 *
	 * Values keep declaration order, so they are reachable both by name and
	 * by position. The plural count is the explicit count if set, otherwise
	 * the value named "count".
	 */
	class Context
	{
		public:

			typedef std::pair<std::string, Value> Entry;

			Context () = default;
			Context (std::initializer_list<Entry> values);

			/** replaces an existing value of the same name */
			Context& Set (const std::string& name, Value value);
			Context& SetCount (int64_t count) { m_Count = count; return *this; };

			const Value * Get (std::string_view name) const;
			const Value * Get (size_t index) const;
			size_t GetSize () const { return m_Values.size (); };
			bool IsEmpty () const { return m_Values.empty () && !m_Count; };

			std::optional<Value> GetCount () const;
			bool HasCount () const;

		private:

			std::vector<Entry> m_Values;
			std::optional<int64_t> m_Count;
	};

	const char COUNT_VALUE_NAME[] = "count";
}

#endif
