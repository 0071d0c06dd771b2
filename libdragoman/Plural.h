/*
* Copyright (c) 2024, The Dragoman Project
*
* This file is part of Dragoman project and licensed under BSD3
*
* See full license text in LICENSE file at top of project tree
*/

#ifndef PLURAL_H__
#define PLURAL_H__

#include <inttypes.h>
#include <string>
#include <string_view>
#include <vector>
#include <optional>

namespace dragoman
{
	const char PLURAL_SEPARATOR = '|';

	/**
	 * @brief Guard of a plural branch
	 *
	 * {1}, {1, 2, 3}, {2..4}, {..4}, {5..}
	 */
	class PluralRule
	{
		public:

			enum Type
			{
				eRuleMatch = 0, // one of the listed values
				eRuleRange,     // from <= n <= to
				eRuleRangeFrom, // n >= from
				eRuleRangeTo    // n <= to
			};

			static PluralRule Match (std::vector<int64_t> values);
			static PluralRule Range (int64_t from, int64_t to);
			static PluralRule RangeFrom (int64_t from);
			static PluralRule RangeTo (int64_t to);

			Type GetType () const { return m_Type; };
			bool Matches (int64_t n) const;
			std::string ToString () const;

		private:

			PluralRule (Type type): m_Type (type), m_From (0), m_To (0) {};

		private:

			Type m_Type;
			int64_t m_From, m_To;
			std::vector<int64_t> m_Values;
	};

	/**
	 * @brief Parsed message template
	 *
	 * A simple template is a single text. A pluralized one is a list of
	 * guarded branches separated by '|' whose last branch is the default.
	 * "||" stands for a literal '|' in both forms.
	 */
	class Template
	{
		public:

			struct Branch
			{
				PluralRule rule;
				std::string text;
			};

			bool IsPlural () const { return !m_Branches.empty (); };
			const std::vector<Branch>& GetBranches () const { return m_Branches; };
			/** whole text of a simple template, default branch of a pluralized one */
			const std::string& GetDefault () const { return m_Default; };

			/**
			 * @brief First branch whose guard matches, default branch otherwise
			 * @param count Integral count, nothing if the count has no integral form
			 */
			const std::string& Select (std::optional<int64_t> count) const;

		private:

			friend Template ParseTemplate (std::string_view message);

			std::vector<Branch> m_Branches;
			std::string m_Default;
	};

	/**
	 * @brief Parse a raw template
	 * @throws TemplateError for malformed guards or a missing default branch
	 */
	Template ParseTemplate (std::string_view message);

	/**
	 * @brief Parse a single guard, the part between the braces
	 * @throws TemplateError
	 */
	PluralRule ParsePluralRule (std::string_view rule, std::string_view branch);
}

#endif
