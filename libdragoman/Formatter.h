/*
* Copyright (c) 2024, The Dragoman Project
*
* This file is part of Dragoman project and licensed under BSD3
*
* See full license text in LICENSE file at top of project tree
*/

#ifndef FORMATTER_H__
#define FORMATTER_H__

#include <string>
#include <string_view>
#include "Locale.h"
#include "Context.h"

namespace dragoman
{
	/**
	 * @brief Replace placeholders of resolved text with context values
	 *
	 * {name} named value, {n} positional value, {} next positional value,
	 * {?} plural count, {{ and }} literal braces. A placeholder that can't
	 * be resolved stays in the output as written.
	 */
	std::string Interpolate (std::string_view text, const Context& context);

	class Formatter
	{
		public:

			virtual ~Formatter () {};
			/**
			 * @brief Turn a raw template into the final message
			 * @param locale Locale the template was found for
			 * @throws TemplateError, MissingPluralContext
			 */
			virtual std::string Format (const Locale& locale, const std::string& message, const Context& context) const = 0;
	};

	/** plural branch selection followed by interpolation */
	class DefaultFormatter: public Formatter
	{
		public:

			std::string Format (const Locale& locale, const std::string& message, const Context& context) const override;
	};
}

#endif
