/*
* Copyright (c) 2024, The Dragoman Project
*
* This file is part of Dragoman project and licensed under BSD3
*
* See full license text in LICENSE file at top of project tree
*/

#include <map>
#include <cctype>
#include <utility>
#include "Error.h"
#include "Locale.h"

namespace dragoman
{
	struct LanguageData
	{
		Language language;
		const char * code; // ISO 639-1
		const char * name; // english name
	};

	// must follow the order of Language
	static const LanguageData languages[] =
	{
		{ Language::Afar, "aa", "Afar" },
		{ Language::Abkhazian, "ab", "Abkhazian" },
		{ Language::Afrikaans, "af", "Afrikaans" },
		{ Language::Akan, "ak", "Akan" },
		{ Language::Albanian, "sq", "Albanian" },
		{ Language::Amharic, "am", "Amharic" },
		{ Language::Arabic, "ar", "Arabic" },
		{ Language::Aragonese, "an", "Aragonese" },
		{ Language::Armenian, "hy", "Armenian" },
		{ Language::Assamese, "as", "Assamese" },
		{ Language::Avaric, "av", "Avaric" },
		{ Language::Avestan, "ae", "Avestan" },
		{ Language::Aymara, "ay", "Aymara" },
		{ Language::Azerbaijani, "az", "Azerbaijani" },
		{ Language::Bashkir, "ba", "Bashkir" },
		{ Language::Bambara, "bm", "Bambara" },
		{ Language::Basque, "eu", "Basque" },
		{ Language::Belarusian, "be", "Belarusian" },
		{ Language::Bengali, "bn", "Bengali" },
		{ Language::Bihari, "bh", "Bihari" },
		{ Language::Bislama, "bi", "Bislama" },
		{ Language::Tibetan, "bo", "Tibetan" },
		{ Language::Bosnian, "bs", "Bosnian" },
		{ Language::Breton, "br", "Breton" },
		{ Language::Bulgarian, "bg", "Bulgarian" },
		{ Language::Burmese, "my", "Burmese" },
		{ Language::Catalan, "ca", "Catalan" },
		{ Language::Czech, "cs", "Czech" },
		{ Language::Chamorro, "ch", "Chamorro" },
		{ Language::Chechen, "ce", "Chechen" },
		{ Language::Chinese, "zh", "Chinese" },
		{ Language::ChurchSlavic, "cu", "Church Slavic" },
		{ Language::Chuvash, "cv", "Chuvash" },
		{ Language::Cornish, "kw", "Cornish" },
		{ Language::Corsican, "co", "Corsican" },
		{ Language::Cree, "cr", "Cree" },
		{ Language::Welsh, "cy", "Welsh" },
		{ Language::Danish, "da", "Danish" },
		{ Language::German, "de", "German" },
		{ Language::Divehi, "dv", "Divehi" },
		{ Language::Dutch, "nl", "Dutch" },
		{ Language::Dzongkha, "dz", "Dzongkha" },
		{ Language::Greek, "el", "Greek" },
		{ Language::English, "en", "English" },
		{ Language::Esperanto, "eo", "Esperanto" },
		{ Language::Estonian, "et", "Estonian" },
		{ Language::Ewe, "ee", "Ewe" },
		{ Language::Faroese, "fo", "Faroese" },
		{ Language::Persian, "fa", "Persian" },
		{ Language::Fijian, "fj", "Fijian" },
		{ Language::Finnish, "fi", "Finnish" },
		{ Language::French, "fr", "French" },
		{ Language::WesternFrisian, "fy", "Western Frisian" },
		{ Language::Fulah, "ff", "Fulah" },
		{ Language::Georgian, "ka", "Georgian" },
		{ Language::Gaelic, "gd", "Gaelic" },
		{ Language::Irish, "ga", "Irish" },
		{ Language::Galician, "gl", "Galician" },
		{ Language::Manx, "gv", "Manx" },
		{ Language::Guarani, "gn", "Guarani" },
		{ Language::Gujarati, "gu", "Gujarati" },
		{ Language::Haitian, "ht", "Haitian" },
		{ Language::Hausa, "ha", "Hausa" },
		{ Language::Hebrew, "he", "Hebrew" },
		{ Language::Herero, "hz", "Herero" },
		{ Language::Hindi, "hi", "Hindi" },
		{ Language::HiriMotu, "ho", "Hiri Motu" },
		{ Language::Croatian, "hr", "Croatian" },
		{ Language::Hungarian, "hu", "Hungarian" },
		{ Language::Igbo, "ig", "Igbo" },
		{ Language::Icelandic, "is", "Icelandic" },
		{ Language::Ido, "io", "Ido" },
		{ Language::SichuanYi, "ii", "Sichuan Yi" },
		{ Language::Inuktitut, "iu", "Inuktitut" },
		{ Language::Interlingue, "ie", "Interlingue" },
		{ Language::Indonesian, "id", "Indonesian" },
		{ Language::Inupiaq, "ik", "Inupiaq" },
		{ Language::Italian, "it", "Italian" },
		{ Language::Javanese, "jv", "Javanese" },
		{ Language::Japanese, "ja", "Japanese" },
		{ Language::Kalaallisut, "kl", "Kalaallisut" },
		{ Language::Kannada, "kn", "Kannada" },
		{ Language::Kashmiri, "ks", "Kashmiri" },
		{ Language::Kanuri, "kr", "Kanuri" },
		{ Language::Kazakh, "kk", "Kazakh" },
		{ Language::CentralKhmer, "km", "Central Khmer" },
		{ Language::Kikuyu, "ki", "Kikuyu" },
		{ Language::Kinyarwanda, "rw", "Kinyarwanda" },
		{ Language::Kirghiz, "ky", "Kirghiz" },
		{ Language::Komi, "kv", "Komi" },
		{ Language::Kongo, "kg", "Kongo" },
		{ Language::Korean, "ko", "Korean" },
		{ Language::Kuanyama, "kj", "Kuanyama" },
		{ Language::Kurdish, "ku", "Kurdish" },
		{ Language::Lao, "lo", "Lao" },
		{ Language::Latin, "la", "Latin" },
		{ Language::Latvian, "lv", "Latvian" },
		{ Language::Limburgan, "li", "Limburgan" },
		{ Language::Lingala, "ln", "Lingala" },
		{ Language::Lithuanian, "lt", "Lithuanian" },
		{ Language::Luxembourgish, "lb", "Luxembourgish" },
		{ Language::LubaKatanga, "lu", "Luba Katanga" },
		{ Language::Ganda, "lg", "Ganda" },
		{ Language::Macedonian, "mk", "Macedonian" },
		{ Language::Marshallese, "mh", "Marshallese" },
		{ Language::Malayalam, "ml", "Malayalam" },
		{ Language::Maori, "mi", "Maori" },
		{ Language::Marathi, "mr", "Marathi" },
		{ Language::Malay, "ms", "Malay" },
		{ Language::Malagasy, "mg", "Malagasy" },
		{ Language::Maltese, "mt", "Maltese" },
		{ Language::Mongolian, "mn", "Mongolian" },
		{ Language::Nauru, "na", "Nauru" },
		{ Language::Navajo, "nv", "Navajo" },
		{ Language::SouthernNdebele, "nr", "Southern Ndebele" },
		{ Language::NorthernNdebele, "nd", "Northern Ndebele" },
		{ Language::Ndonga, "ng", "Ndonga" },
		{ Language::Nepali, "ne", "Nepali" },
		{ Language::NorwegianNynorsk, "nn", "Norwegian Nynorsk" },
		{ Language::Norwegian, "no", "Norwegian" },
		{ Language::Chichewa, "ny", "Chichewa" },
		{ Language::Occitan, "oc", "Occitan" },
		{ Language::Ojibwa, "oj", "Ojibwa" },
		{ Language::Oriya, "or", "Oriya" },
		{ Language::Oromo, "om", "Oromo" },
		{ Language::Ossetian, "os", "Ossetian" },
		{ Language::Panjabi, "pa", "Panjabi" },
		{ Language::Pali, "pi", "Pali" },
		{ Language::Polish, "pl", "Polish" },
		{ Language::Portuguese, "pt", "Portuguese" },
		{ Language::Pushto, "ps", "Pushto" },
		{ Language::Quechua, "qu", "Quechua" },
		{ Language::Romansh, "rm", "Romansh" },
		{ Language::Romanian, "ro", "Romanian" },
		{ Language::Rundi, "rn", "Rundi" },
		{ Language::Russian, "ru", "Russian" },
		{ Language::Sango, "sg", "Sango" },
		{ Language::Sanskrit, "sa", "Sanskrit" },
		{ Language::Sinhala, "si", "Sinhala" },
		{ Language::Slovak, "sk", "Slovak" },
		{ Language::Slovenian, "sl", "Slovenian" },
		{ Language::NorthernSami, "se", "Northern Sami" },
		{ Language::Samoan, "sm", "Samoan" },
		{ Language::Shona, "sn", "Shona" },
		{ Language::Sindhi, "sd", "Sindhi" },
		{ Language::Somali, "so", "Somali" },
		{ Language::SouthernSotho, "st", "Southern Sotho" },
		{ Language::Spanish, "es", "Spanish" },
		{ Language::Sardinian, "sc", "Sardinian" },
		{ Language::Serbian, "sr", "Serbian" },
		{ Language::Swati, "ss", "Swati" },
		{ Language::Sundanese, "su", "Sundanese" },
		{ Language::Swahili, "sw", "Swahili" },
		{ Language::Swedish, "sv", "Swedish" },
		{ Language::Tahitian, "ty", "Tahitian" },
		{ Language::Tamil, "ta", "Tamil" },
		{ Language::Tatar, "tt", "Tatar" },
		{ Language::Telugu, "te", "Telugu" },
		{ Language::Tajik, "tg", "Tajik" },
		{ Language::Tagalog, "tl", "Tagalog" },
		{ Language::Thai, "th", "Thai" },
		{ Language::Tigrinya, "ti", "Tigrinya" },
		{ Language::Tonga, "to", "Tonga" },
		{ Language::Tswana, "tn", "Tswana" },
		{ Language::Tsonga, "ts", "Tsonga" },
		{ Language::Turkmen, "tk", "Turkmen" },
		{ Language::Turkish, "tr", "Turkish" },
		{ Language::Twi, "tw", "Twi" },
		{ Language::Uighur, "ug", "Uighur" },
		{ Language::Ukrainian, "uk", "Ukrainian" },
		{ Language::Urdu, "ur", "Urdu" },
		{ Language::Uzbek, "uz", "Uzbek" },
		{ Language::Venda, "ve", "Venda" },
		{ Language::Vietnamese, "vi", "Vietnamese" },
		{ Language::Walloon, "wa", "Walloon" },
		{ Language::Wolof, "wo", "Wolof" },
		{ Language::Xhosa, "xh", "Xhosa" },
		{ Language::Yiddish, "yi", "Yiddish" },
		{ Language::Yoruba, "yo", "Yoruba" },
		{ Language::Zhuang, "za", "Zhuang" },
		{ Language::Zulu, "zu", "Zulu" },
	};
	const size_t NUM_LANGUAGES = sizeof (languages) / sizeof (languages[0]);

	struct RegionData
	{
		Region region;
		const char * code; // ISO 3166-1 alpha-2
	};

	// must follow the order of Region
	static const RegionData regions[] =
	{
		{ Region::None, "" },
		{ Region::Algeria, "DZ" }, { Region::Bahrain, "BH" }, { Region::Egypt, "EG" },
		{ Region::Iraq, "IQ" }, { Region::Jordan, "JO" }, { Region::Kuwait, "KW" },
		{ Region::Lebanon, "LB" }, { Region::Libya, "LY" }, { Region::Morocco, "MA" },
		{ Region::Oman, "OM" }, { Region::Qatar, "QA" }, { Region::SaudiArabia, "SA" },
		{ Region::Syria, "SY" }, { Region::Tunisia, "TN" }, { Region::UnitedArabEmirates, "AE" },
		{ Region::Yemen, "YE" },
		{ Region::HongKong, "HK" }, { Region::China, "CN" }, { Region::Singapore, "SG" },
		{ Region::Taiwan, "TW" },
		{ Region::Austria, "AT" }, { Region::Liechtenstein, "LI" }, { Region::Luxembourg, "LU" },
		{ Region::Switzerland, "CH" }, { Region::Belgium, "BE" }, { Region::France, "FR" },
		{ Region::Australia, "AU" }, { Region::Belize, "BZ" }, { Region::Canada, "CA" },
		{ Region::Ireland, "IE" }, { Region::Jamaica, "JM" }, { Region::NewZealand, "NZ" },
		{ Region::SouthAfrica, "ZA" }, { Region::Trinidad, "TT" }, { Region::UnitedKingdom, "GB" },
		{ Region::UnitedStates, "US" },
		{ Region::Brazil, "BR" }, { Region::Moldova, "MD" }, { Region::Finland, "FI" },
		{ Region::Argentina, "AR" }, { Region::Bolivia, "BO" }, { Region::Chile, "CL" },
		{ Region::Colombia, "CO" }, { Region::CostaRica, "CR" }, { Region::DominicanRepublic, "DO" },
		{ Region::Ecuador, "EC" }, { Region::ElSalvador, "SV" }, { Region::Guatemala, "GT" },
		{ Region::Honduras, "HN" }, { Region::Mexico, "MX" }, { Region::Nicaragua, "NI" },
		{ Region::Panama, "PA" }, { Region::Paraguay, "PY" }, { Region::Peru, "PE" },
		{ Region::PuertoRico, "PR" }, { Region::Uruguay, "UY" }, { Region::Venezuela, "VE" }
	};
	const size_t NUM_REGIONS = sizeof (regions) / sizeof (regions[0]);

	// language variants, grouped by language
	static const std::pair<Language, Region> variants[] =
	{
		{ Language::Arabic, Region::Algeria }, { Language::Arabic, Region::Bahrain },
		{ Language::Arabic, Region::Egypt }, { Language::Arabic, Region::Iraq },
		{ Language::Arabic, Region::Jordan }, { Language::Arabic, Region::Kuwait },
		{ Language::Arabic, Region::Lebanon }, { Language::Arabic, Region::Libya },
		{ Language::Arabic, Region::Morocco }, { Language::Arabic, Region::Oman },
		{ Language::Arabic, Region::Qatar }, { Language::Arabic, Region::SaudiArabia },
		{ Language::Arabic, Region::Syria }, { Language::Arabic, Region::Tunisia },
		{ Language::Arabic, Region::UnitedArabEmirates }, { Language::Arabic, Region::Yemen },
		{ Language::Chinese, Region::HongKong }, { Language::Chinese, Region::China },
		{ Language::Chinese, Region::Singapore }, { Language::Chinese, Region::Taiwan },
		{ Language::German, Region::Austria }, { Language::German, Region::Liechtenstein },
		{ Language::German, Region::Luxembourg }, { Language::German, Region::Switzerland },
		{ Language::Dutch, Region::Belgium },
		{ Language::English, Region::Australia }, { Language::English, Region::Belize },
		{ Language::English, Region::Canada }, { Language::English, Region::Ireland },
		{ Language::English, Region::Jamaica }, { Language::English, Region::NewZealand },
		{ Language::English, Region::SouthAfrica }, { Language::English, Region::Trinidad },
		{ Language::English, Region::UnitedKingdom }, { Language::English, Region::UnitedStates },
		{ Language::French, Region::France }, { Language::French, Region::Belgium },
		{ Language::French, Region::Canada }, { Language::French, Region::Luxembourg },
		{ Language::French, Region::Switzerland },
		{ Language::Italian, Region::Switzerland },
		{ Language::Portuguese, Region::Brazil },
		{ Language::Romanian, Region::Moldova },
		{ Language::Russian, Region::Moldova },
		{ Language::Spanish, Region::Argentina }, { Language::Spanish, Region::Bolivia },
		{ Language::Spanish, Region::Chile }, { Language::Spanish, Region::Colombia },
		{ Language::Spanish, Region::CostaRica }, { Language::Spanish, Region::DominicanRepublic },
		{ Language::Spanish, Region::Ecuador }, { Language::Spanish, Region::ElSalvador },
		{ Language::Spanish, Region::Guatemala }, { Language::Spanish, Region::Honduras },
		{ Language::Spanish, Region::Mexico }, { Language::Spanish, Region::Nicaragua },
		{ Language::Spanish, Region::Panama }, { Language::Spanish, Region::Paraguay },
		{ Language::Spanish, Region::Peru }, { Language::Spanish, Region::PuertoRico },
		{ Language::Spanish, Region::Uruguay }, { Language::Spanish, Region::Venezuela },
		{ Language::Swedish, Region::Finland }
	};

	static bool IsKnownVariant (Language language, Region region)
	{
		for (const auto& it: variants)
			if (it.first == language && it.second == region) return true;
		return false;
	}

	static const LanguageData& GetLanguageData (Language language)
	{
		return languages[static_cast<size_t>(language)];
	}

	static std::string ToLower (std::string_view s)
	{
		std::string ret (s);
		for (auto& c: ret) c = std::tolower ((unsigned char)c);
		return ret;
	}

	static std::string ToUpper (std::string_view s)
	{
		std::string ret (s);
		for (auto& c: ret) c = std::toupper ((unsigned char)c);
		return ret;
	}

	Locale::Locale (Language language, Region region):
		m_Language (language), m_Region (region)
	{
		if (region != Region::None && !IsKnownVariant (language, region))
			throw LocaleParseError (std::string (GetLanguageData (language).code) + "_" +
				regions[static_cast<size_t>(region)].code);
	}

	Locale Locale::FromTag (std::string_view tag)
	{
		static const std::map<std::string, Language> languageCodes = []
		{
			std::map<std::string, Language> codes;
			for (size_t i = 0; i < NUM_LANGUAGES; i++)
				codes.emplace (languages[i].code, languages[i].language);
			return codes;
		}();
		static const std::map<std::string, Region> regionCodes = []
		{
			std::map<std::string, Region> codes;
			for (size_t i = 1; i < NUM_REGIONS; i++) // skip None
				codes.emplace (regions[i].code, regions[i].region);
			return codes;
		}();

		auto pos = tag.find_first_of ("_-");
		auto it = languageCodes.find (ToLower (tag.substr (0, pos)));
		if (it == languageCodes.end ())
			throw LocaleParseError (std::string (tag));
		if (pos == std::string_view::npos)
			return Locale (it->second);

		auto it1 = regionCodes.find (ToUpper (tag.substr (pos + 1)));
		if (it1 == regionCodes.end () || !IsKnownVariant (it->second, it1->second))
			throw LocaleParseError (std::string (tag));
		return Locale (it->second, it1->second);
	}

	std::string Locale::ToTag () const
	{
		std::string tag = GetLanguageCode ();
		if (m_Region != Region::None)
		{
			tag += '_';
			tag += regions[static_cast<size_t>(m_Region)].code;
		}
		return tag;
	}

	std::optional<Locale> Locale::GetParent () const
	{
		if (m_Region != Region::None)
			return GetBase ();
		return std::nullopt;
	}

	std::vector<Locale> Locale::GetFallbackChain () const
	{
		std::vector<Locale> chain;
		std::optional<Locale> current = *this;
		while (current)
		{
			chain.push_back (*current);
			current = current->GetParent ();
		}
		return chain;
	}

	const char * Locale::GetLanguageName () const
	{
		return GetLanguageData (m_Language).name;
	}

	const char * Locale::GetLanguageCode () const
	{
		return GetLanguageData (m_Language).code;
	}

	std::ostream& operator<< (std::ostream& s, const Locale& locale)
	{
		return s << locale.ToTag ();
	}

	const std::vector<Locale>& GetAllLocales ()
	{
		static const std::vector<Locale> locales = []
		{
			std::vector<Locale> ret;
			for (size_t i = 0; i < NUM_LANGUAGES; i++)
			{
				ret.emplace_back (languages[i].language);
				for (const auto& it: variants)
					if (it.first == languages[i].language)
						ret.emplace_back (it.first, it.second);
			}
			return ret;
		}();
		return locales;
	}
}
