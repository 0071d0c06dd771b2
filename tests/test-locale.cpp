#define BOOST_TEST_DYN_LINK
#define BOOST_TEST_MODULE LocaleTests

#include <set>
#include <sstream>
#include <boost/test/unit_test.hpp>
#include "Error.h"
#include "Locale.h"

BOOST_AUTO_TEST_SUITE(LocaleTests)

using namespace dragoman;

BOOST_AUTO_TEST_CASE(ParseBaseTag)
{
	auto locale = Locale::FromTag ("en");
	BOOST_CHECK(locale == Locale (Language::English));
	BOOST_CHECK(!locale.HasVariant ());
	BOOST_CHECK_EQUAL(locale.ToTag (), "en");
	BOOST_CHECK_EQUAL(locale.GetLanguageName (), std::string ("English"));
	BOOST_CHECK_EQUAL(Locale::FromTag ("en_AU").GetLanguageCode (), std::string ("en"));
}

BOOST_AUTO_TEST_CASE(ParseVariantTag)
{
	auto locale = Locale::FromTag ("zh_CN");
	BOOST_CHECK(locale.GetLanguage () == Language::Chinese);
	BOOST_CHECK(locale.GetRegion () == Region::China);
	BOOST_CHECK_EQUAL(locale.ToTag (), "zh_CN");
	BOOST_CHECK(Locale::FromTag ("zh-cn") == locale);
	BOOST_CHECK(Locale::FromTag ("ZH_cn") == locale);
}

BOOST_AUTO_TEST_CASE(RejectUnknownTags)
{
	BOOST_CHECK_THROW(Locale::FromTag (""), LocaleParseError);
	BOOST_CHECK_THROW(Locale::FromTag ("xx"), LocaleParseError);
	BOOST_CHECK_THROW(Locale::FromTag ("en_"), LocaleParseError);
	BOOST_CHECK_THROW(Locale::FromTag ("en_XX"), LocaleParseError);
	// valid region, but not a variant of this language
	BOOST_CHECK_THROW(Locale::FromTag ("de_US"), LocaleParseError);
	BOOST_CHECK_THROW(Locale (Language::German, Region::UnitedStates), LocaleParseError);

	try
	{
		Locale::FromTag ("klingon");
		BOOST_FAIL("no exception");
	}
	catch (LocaleParseError& ex)
	{
		BOOST_CHECK_EQUAL(ex.GetTag (), "klingon");
		BOOST_CHECK_EQUAL(std::string (ex.what ()),
			"locale: invalid locale, expected a valid locale code but found 'klingon'");
	}
}

BOOST_AUTO_TEST_CASE(ParentOfVariantIsBase)
{
	auto parent = Locale::FromTag ("fr_CA").GetParent ();
	BOOST_REQUIRE(parent);
	BOOST_CHECK(*parent == Locale (Language::French));
	BOOST_CHECK(!parent->GetParent ());
	BOOST_CHECK(!Locale (Language::Japanese).GetParent ());
}

BOOST_AUTO_TEST_CASE(FallbackChain)
{
	auto chain = Locale::FromTag ("es_MX").GetFallbackChain ();
	BOOST_REQUIRE_EQUAL(chain.size (), 2);
	BOOST_CHECK_EQUAL(chain[0].ToTag (), "es_MX");
	BOOST_CHECK_EQUAL(chain[1].ToTag (), "es");

	chain = Locale (Language::Welsh).GetFallbackChain ();
	BOOST_REQUIRE_EQUAL(chain.size (), 1);
	BOOST_CHECK(chain[0] == Locale (Language::Welsh));
}

BOOST_AUTO_TEST_CASE(AllLocalesRoundTrip)
{
	const auto& locales = GetAllLocales ();
	// 181 languages and 63 regional variants
	BOOST_CHECK_EQUAL(locales.size (), 244);

	std::set<std::string> tags;
	for (const auto& locale: locales)
	{
		auto tag = locale.ToTag ();
		BOOST_CHECK(tags.insert (tag).second);
		BOOST_CHECK(Locale::FromTag (tag) == locale);
		// every chain ends at a base language
		auto chain = locale.GetFallbackChain ();
		BOOST_CHECK(chain.front () == locale);
		BOOST_CHECK(!chain.back ().HasVariant ());
		BOOST_CHECK_LE(chain.size (), 2);
	}
}

BOOST_AUTO_TEST_CASE(SameRegionDifferentLanguages)
{
	auto frCH = Locale::FromTag ("fr_CH"), deCH = Locale::FromTag ("de_CH"), itCH = Locale::FromTag ("it_CH");
	BOOST_CHECK(frCH != deCH);
	BOOST_CHECK(*frCH.GetParent () == Locale (Language::French));
	BOOST_CHECK(*deCH.GetParent () == Locale (Language::German));
	BOOST_CHECK(*itCH.GetParent () == Locale (Language::Italian));
}

BOOST_AUTO_TEST_CASE(StreamOutput)
{
	std::stringstream s;
	s << Locale::FromTag ("pt-br") << " " << Locale (Language::Portuguese);
	BOOST_CHECK_EQUAL(s.str (), "pt_BR pt");
}

BOOST_AUTO_TEST_SUITE_END()
