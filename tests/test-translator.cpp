#define BOOST_TEST_DYN_LINK
#define BOOST_TEST_MODULE TranslatorTests

#include <cctype>
#include <memory>
#include <sstream>
#include <thread>
#include <vector>
#include <boost/test/unit_test.hpp>
#include "Log.h"
#include "Error.h"
#include "Translator.h"

BOOST_AUTO_TEST_SUITE(TranslatorTests)

using namespace dragoman;

static const char APPLES[] = "{0} There are no apples | {1} There is one apple | {2..4} There are few apples | There are {?} apples";

static CatalogueBag MakeBag ()
{
	Catalogue en (Language::English), enGB (Locale (Language::English, Region::UnitedKingdom)), fr (Language::French);
	en.Insert ("messages", "greeting", "Hello, {name}!");
	en.Insert ("messages", "apples", APPLES);
	en.Insert ("messages", "color", "color");
	en.Insert ("errors", "broken", "{x} one | many");
	enGB.Insert ("messages", "color", "colour");
	fr.Insert ("messages", "greeting", "Bonjour, {name} !");
	return CatalogueBag ({ en, enGB, fr });
}

BOOST_AUTO_TEST_CASE(FallbackToConfiguredLocale)
{
	Translator translator (MakeBag (), Locale (Language::English));
	BOOST_CHECK_EQUAL(translator.Translate (Language::Chinese, "messages", "greeting", Context { { "name", "世界" } }),
		"Hello, 世界!");
}

BOOST_AUTO_TEST_CASE(PluralSelection)
{
	Translator translator (MakeBag ());
	BOOST_CHECK_EQUAL(translator.Translate (Language::English, "messages", "apples", 0), "There are no apples");
	BOOST_CHECK_EQUAL(translator.Translate (Language::English, "messages", "apples", 1), "There is one apple");
	BOOST_CHECK_EQUAL(translator.Translate (Language::English, "messages", "apples", 3), "There are few apples");
	BOOST_CHECK_EQUAL(translator.Translate (Language::English, "messages", "apples", 10), "There are 10 apples");
}

BOOST_AUTO_TEST_CASE(MessageNotFoundNamesAttemptedLocales)
{
	Translator translator (MakeBag (), Locale (Language::English));
	try
	{
		translator.Translate (Locale::FromTag ("fr_CA"), "messages", "missing");
		BOOST_FAIL("no exception");
	}
	catch (MessageNotFound& ex)
	{
		BOOST_CHECK_EQUAL(ex.GetDomain (), "messages");
		BOOST_CHECK_EQUAL(ex.GetId (), "missing");
		const auto& attempted = ex.GetAttemptedLocales ();
		BOOST_REQUIRE_EQUAL(attempted.size (), 3);
		BOOST_CHECK_EQUAL(attempted[0].ToTag (), "fr_CA");
		BOOST_CHECK_EQUAL(attempted[1].ToTag (), "fr");
		BOOST_CHECK_EQUAL(attempted[2].ToTag (), "en");
		BOOST_CHECK_EQUAL(std::string (ex.what ()),
			"message not found: message 'missing' could not be found in 'messages' domain for locales 'fr_CA', 'fr', 'en'");
	}
}

BOOST_AUTO_TEST_CASE(MissingCount)
{
	Translator translator (MakeBag ());
	BOOST_CHECK_THROW(translator.Translate (Language::English, "messages", "apples"), MissingPluralContext);
	BOOST_CHECK_THROW(translator.Translate (Language::English, "errors", "broken", 1), TemplateError);
}

BOOST_AUTO_TEST_CASE(VariantBeforeBase)
{
	Translator translator (MakeBag ());
	BOOST_CHECK_EQUAL(translator.Translate (Locale::FromTag ("en_GB"), "messages", "color"), "colour");
	BOOST_CHECK_EQUAL(translator.Translate (Locale::FromTag ("en_US"), "messages", "color"), "color");
	// resolved from the base catalogue
	BOOST_CHECK_EQUAL(translator.Translate (Locale::FromTag ("en_GB"), "messages", "greeting", Context { { "name", "Ann" } }),
		"Hello, Ann!");
}

BOOST_AUTO_TEST_CASE(LocaleBeforeFallback)
{
	Translator translator (MakeBag (), Locale (Language::English));
	BOOST_CHECK_EQUAL(translator.Translate (Language::French, "messages", "greeting", Context { { "name", "Ann" } }),
		"Bonjour, Ann !");
	BOOST_CHECK_EQUAL(translator.Translate (Language::French, "messages", "color"), "color");
}

BOOST_AUTO_TEST_CASE(NoFallback)
{
	Translator translator (MakeBag ());
	BOOST_CHECK(!translator.GetFallbackLocale ());
	BOOST_CHECK_THROW(translator.Translate (Language::Chinese, "messages", "greeting"), MessageNotFound);
	BOOST_CHECK(!translator.Has (Language::Chinese, "messages", "greeting"));

	translator.SetFallbackLocale (Locale (Language::French));
	BOOST_CHECK(translator.Has (Language::Chinese, "messages", "greeting"));
	BOOST_CHECK_EQUAL(translator.Translate (Language::Chinese, "messages", "greeting", Context { { "name", "Ann" } }),
		"Bonjour, Ann !");
}

BOOST_AUTO_TEST_CASE(FallbackNotRepeated)
{
	Translator translator (MakeBag (), Locale (Language::English));
	auto chain = translator.GetFallbackChain (Locale::FromTag ("en_GB"));
	BOOST_REQUIRE_EQUAL(chain.size (), 2);
	BOOST_CHECK_EQUAL(chain[0].ToTag (), "en_GB");
	BOOST_CHECK_EQUAL(chain[1].ToTag (), "en");
}

BOOST_AUTO_TEST_CASE(TranslateByTag)
{
	Translator translator (MakeBag ());
	BOOST_CHECK_EQUAL(translator.Translate ("en-gb", "messages", "color"), "colour");
	BOOST_CHECK_THROW(translator.Translate ("xx", "messages", "color"), LocaleParseError);
}

BOOST_AUTO_TEST_CASE(Deterministic)
{
	auto translator = std::make_shared<Translator> (MakeBag (), Locale (Language::English));
	const auto expected = translator->Translate (Language::German, "messages", "apples", 3);
	std::vector<std::thread> threads;
	std::vector<std::string> results (8);
	for (size_t i = 0; i < results.size (); i++)
		threads.emplace_back ([translator, &results, i]()
			{
				results[i] = translator->Translate (Language::German, "messages", "apples", 3);
			});
	for (auto& it: threads)
		it.join ();
	for (const auto& it: results)
		BOOST_CHECK_EQUAL(it, expected);
}

BOOST_AUTO_TEST_CASE(CheckReportsMalformedTemplates)
{
	Translator translator (MakeBag ());
	auto issues = translator.Check ();
	BOOST_REQUIRE_EQUAL(issues.size (), 1);
	BOOST_CHECK(issues[0].locale == Locale (Language::English));
	BOOST_CHECK_EQUAL(issues[0].domain, "errors");
	BOOST_CHECK_EQUAL(issues[0].id, "broken");
	BOOST_CHECK(!issues[0].reason.empty ());
}

BOOST_AUTO_TEST_CASE(FailuresAreLoggedNotKept)
{
	auto& log = dragoman::log::Logger ();
	auto out = std::make_shared<std::stringstream> ();
	log.SendTo (out);
	log.SetLogLevel ("debug");

	Translator translator (MakeBag ());
	for (int i = 0; i < 1000; i++)
		BOOST_CHECK_THROW(translator.Translate (Language::English, "errors", "broken", 1), TemplateError);
	// written as they come, without Ready ()
	BOOST_CHECK_EQUAL(log.GetNumHeldMessages (), 0);
	BOOST_CHECK(out->str ().find ("Malformed template 'broken' in 'errors' domain for en") != std::string::npos);

	log.SetLogLevel ("warn");
}

class UpperFormatter: public Formatter
{
	public:

		std::string Format (const Locale& locale, const std::string& message, const Context& context) const override
		{
			auto s = locale.ToTag () + ":" + message;
			for (auto& c: s) c = std::toupper ((unsigned char)c);
			return s;
		}
};

BOOST_AUTO_TEST_CASE(CustomFormatter)
{
	Translator translator (std::make_shared<const CatalogueBag> (MakeBag ()), std::nullopt,
		std::make_shared<UpperFormatter> ());
	// formatter gets the locale the message was found for
	BOOST_CHECK_EQUAL(translator.Translate (Locale::FromTag ("en_US"), "messages", "color"), "EN:COLOR");
}

BOOST_AUTO_TEST_SUITE_END()
