/*
* Copyright (c) 2024, The Dragoman Project
*
* This file is part of Dragoman project and licensed under BSD3
*
* See full license text in LICENSE file at top of project tree
*/

#ifndef LOCALE_H__
#define LOCALE_H__

#include <inttypes.h>
#include <string>
#include <string_view>
#include <vector>
#include <optional>
#include <ostream>

namespace dragoman
{
	/**
	 * Closed set of supported languages (ISO 639-1)
	 */
	enum class Language: uint8_t
	{
		Afar, Abkhazian, Afrikaans, Akan, Albanian, Amharic,
		Arabic, Aragonese, Armenian, Assamese, Avaric, Avestan,
		Aymara, Azerbaijani, Bashkir, Bambara, Basque, Belarusian,
		Bengali, Bihari, Bislama, Tibetan, Bosnian, Breton,
		Bulgarian, Burmese, Catalan, Czech, Chamorro, Chechen,
		Chinese, ChurchSlavic, Chuvash, Cornish, Corsican, Cree,
		Welsh, Danish, German, Divehi, Dutch, Dzongkha,
		Greek, English, Esperanto, Estonian, Ewe, Faroese,
		Persian, Fijian, Finnish, French, WesternFrisian, Fulah,
		Georgian, Gaelic, Irish, Galician, Manx, Guarani,
		Gujarati, Haitian, Hausa, Hebrew, Herero, Hindi,
		HiriMotu, Croatian, Hungarian, Igbo, Icelandic, Ido,
		SichuanYi, Inuktitut, Interlingue, Indonesian, Inupiaq, Italian,
		Javanese, Japanese, Kalaallisut, Kannada, Kashmiri, Kanuri,
		Kazakh, CentralKhmer, Kikuyu, Kinyarwanda, Kirghiz, Komi,
		Kongo, Korean, Kuanyama, Kurdish, Lao, Latin,
		Latvian, Limburgan, Lingala, Lithuanian, Luxembourgish, LubaKatanga,
		Ganda, Macedonian, Marshallese, Malayalam, Maori, Marathi,
		Malay, Malagasy, Maltese, Mongolian, Nauru, Navajo,
		SouthernNdebele, NorthernNdebele, Ndonga, Nepali, NorwegianNynorsk, Norwegian,
		Chichewa, Occitan, Ojibwa, Oriya, Oromo, Ossetian,
		Panjabi, Pali, Polish, Portuguese, Pushto, Quechua,
		Romansh, Romanian, Rundi, Russian, Sango, Sanskrit,
		Sinhala, Slovak, Slovenian, NorthernSami, Samoan, Shona,
		Sindhi, Somali, SouthernSotho, Spanish, Sardinian, Serbian,
		Swati, Sundanese, Swahili, Swedish, Tahitian, Tamil,
		Tatar, Telugu, Tajik, Tagalog, Thai, Tigrinya,
		Tonga, Tswana, Tsonga, Turkmen, Turkish, Twi,
		Uighur, Ukrainian, Urdu, Uzbek, Venda, Vietnamese,
		Walloon, Wolof, Xhosa, Yiddish, Yoruba, Zhuang,
		Zulu,
	};

	/**
	 * Regions used by the language variants (ISO 3166-1 alpha-2).
	 * Only the language/region pairs listed in Locale.cpp are valid
	 */
	enum class Region: uint8_t
	{
		None = 0,
		// arabic
		Algeria, Bahrain, Egypt, Iraq, Jordan, Kuwait, Lebanon, Libya,
		Morocco, Oman, Qatar, SaudiArabia, Syria, Tunisia, UnitedArabEmirates, Yemen,
		// chinese
		HongKong, China, Singapore, Taiwan,
		// german, dutch, french, italian
		Austria, Liechtenstein, Luxembourg, Switzerland, Belgium, France,
		// english
		Australia, Belize, Canada, Ireland, Jamaica, NewZealand, SouthAfrica,
		Trinidad, UnitedKingdom, UnitedStates,
		// portuguese, romanian, russian, swedish
		Brazil, Moldova, Finland,
		// spanish
		Argentina, Bolivia, Chile, Colombia, CostaRica, DominicanRepublic, Ecuador,
		ElSalvador, Guatemala, Honduras, Mexico, Nicaragua, Panama, Paraguay, Peru,
		PuertoRico, Uruguay, Venezuela
	};

	class Locale
	{
		public:

			/** base language form, always valid */
			Locale (Language language): m_Language (language), m_Region (Region::None) {};
			/** throws LocaleParseError if the pair is not a known variant */
			Locale (Language language, Region region);

			/**
			 * @brief Parse a tag like "en", "en_US" or "en-us"
			 * @throws LocaleParseError for unknown tags
			 */
			static Locale FromTag (std::string_view tag);

			/** canonical tag, "ll" or "ll_RR" */
			std::string ToTag () const;

			/**
			 * @brief Next coarser locale to try
			 * @return base language for a variant, nothing for a base language
			 */
			std::optional<Locale> GetParent () const;

			/** this locale followed by its parents, root last */
			std::vector<Locale> GetFallbackChain () const;

			Locale GetBase () const { return Locale (m_Language); };
			bool HasVariant () const { return m_Region != Region::None; };
			Language GetLanguage () const { return m_Language; };
			Region GetRegion () const { return m_Region; };
			const char * GetLanguageName () const;
			const char * GetLanguageCode () const;

			bool operator== (const Locale& other) const { return m_Language == other.m_Language && m_Region == other.m_Region; };
			bool operator!= (const Locale& other) const { return !(*this == other); };
			bool operator< (const Locale& other) const
			{
				if (m_Language != other.m_Language) return m_Language < other.m_Language;
				return m_Region < other.m_Region;
			};

		private:

			Language m_Language;
			Region m_Region;
	};

	std::ostream& operator<< (std::ostream& s, const Locale& locale);

	/** every supported locale, each base language followed by its variants */
	const std::vector<Locale>& GetAllLocales ();
}

#endif
