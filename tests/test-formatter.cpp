#define BOOST_TEST_DYN_LINK
#define BOOST_TEST_MODULE FormatterTests

#include <cmath>
#include <limits>
#include <boost/test/unit_test.hpp>
#include "Error.h"
#include "Context.h"
#include "Formatter.h"

BOOST_AUTO_TEST_SUITE(FormatterTests)

using namespace dragoman;

BOOST_AUTO_TEST_CASE(ValueRendering)
{
	BOOST_CHECK_EQUAL(Value ("text").ToString (), "text");
	BOOST_CHECK_EQUAL(Value (42).ToString (), "42");
	BOOST_CHECK_EQUAL(Value (-7L).ToString (), "-7");
	BOOST_CHECK_EQUAL(Value (2.5).ToString (), "2.5");
	BOOST_CHECK_EQUAL(Value (0.1).ToString (), "0.1");
}

BOOST_AUTO_TEST_CASE(ValueToInteger)
{
	BOOST_CHECK_EQUAL(*Value (3).ToInteger (), 3);
	BOOST_CHECK_EQUAL(*Value ("12").ToInteger (), 12);
	BOOST_CHECK_EQUAL(*Value (4.0).ToInteger (), 4);
	BOOST_CHECK(!Value ("twelve").ToInteger ());
	BOOST_CHECK(!Value (1.5).ToInteger ());
	BOOST_CHECK(!Value (std::numeric_limits<double>::quiet_NaN ()).ToInteger ());
	BOOST_CHECK(!Value (std::numeric_limits<double>::infinity ()).ToInteger ());
}

BOOST_AUTO_TEST_CASE(ContextCount)
{
	Context context { { "count", 3 } };
	BOOST_REQUIRE(context.GetCount ());
	BOOST_CHECK(*context.GetCount () == Value (3));
	context.SetCount (5);
	BOOST_CHECK(*context.GetCount () == Value (5));
	BOOST_CHECK(!Context ().HasCount ());
	BOOST_CHECK(Context ().IsEmpty ());
}

BOOST_AUTO_TEST_CASE(ContextSetReplaces)
{
	Context context { { "name", "Ann" }, { "city", "Oslo" } };
	context.Set ("name", "Bob");
	BOOST_CHECK_EQUAL(context.GetSize (), 2);
	BOOST_CHECK_EQUAL(context.Get ("name")->ToString (), "Bob");
	BOOST_CHECK_EQUAL(context.Get (0)->ToString (), "Bob");
	BOOST_CHECK(!context.Get (2));
	BOOST_CHECK(!context.Get ("country"));
}

BOOST_AUTO_TEST_CASE(NamedAndPositional)
{
	Context context { { "name", "Ann" }, { "city", "Oslo" } };
	BOOST_CHECK_EQUAL(Interpolate ("Hi {name} from {city}", context), "Hi Ann from Oslo");
	BOOST_CHECK_EQUAL(Interpolate ("Hi { name }", context), "Hi Ann");
	BOOST_CHECK_EQUAL(Interpolate ("{1}, {0}", context), "Oslo, Ann");
	BOOST_CHECK_EQUAL(Interpolate ("{} and {}", context), "Ann and Oslo");
}

BOOST_AUTO_TEST_CASE(CountPlaceholder)
{
	BOOST_CHECK_EQUAL(Interpolate ("{?} apples", Context ().SetCount (10)), "10 apples");
	BOOST_CHECK_EQUAL(Interpolate ("{?} apples", Context { { "count", 2 } }), "2 apples");
}

BOOST_AUTO_TEST_CASE(UnresolvedStayVerbatim)
{
	Context context { { "name", "Ann" } };
	BOOST_CHECK_EQUAL(Interpolate ("Hi {nobody}", context), "Hi {nobody}");
	BOOST_CHECK_EQUAL(Interpolate ("{5}", context), "{5}");
	BOOST_CHECK_EQUAL(Interpolate ("{?}", context), "{?}");
	BOOST_CHECK_EQUAL(Interpolate ("{} {}", context), "Ann {}");
	BOOST_CHECK_EQUAL(Interpolate ("open {name", context), "open {name");
	BOOST_CHECK_EQUAL(Interpolate ("{a {name}", context), "{a Ann");
}

BOOST_AUTO_TEST_CASE(BraceEscapes)
{
	Context context { { "name", "Ann" } };
	BOOST_CHECK_EQUAL(Interpolate ("{{name}} is {name}", context), "{name} is Ann");
	BOOST_CHECK_EQUAL(Interpolate ("a } b", context), "a } b");
}

BOOST_AUTO_TEST_CASE(DefaultFormatterSimple)
{
	DefaultFormatter formatter;
	BOOST_CHECK_EQUAL(formatter.Format (Language::English, "Hello {name}", Context { { "name", "Ann" } }), "Hello Ann");
	BOOST_CHECK_EQUAL(formatter.Format (Language::English, "a || b", Context ()), "a | b");
}

BOOST_AUTO_TEST_CASE(DefaultFormatterPlural)
{
	DefaultFormatter formatter;
	const std::string message = "{0} no apples | {1} one apple | {?} apples";
	BOOST_CHECK_EQUAL(formatter.Format (Language::English, message, Context ().SetCount (0)), "no apples");
	BOOST_CHECK_EQUAL(formatter.Format (Language::English, message, Context ().SetCount (1)), "one apple");
	BOOST_CHECK_EQUAL(formatter.Format (Language::English, message, Context ().SetCount (7)), "7 apples");
	// no integral form, default branch
	BOOST_CHECK_EQUAL(formatter.Format (Language::English, message, Context { { "count", 1.5 } }), "1.5 apples");
	BOOST_CHECK_THROW(formatter.Format (Language::English, message, Context ()), MissingPluralContext);
	BOOST_CHECK_THROW(formatter.Format (Language::English, "{x} bad | ok", Context ().SetCount (1)), TemplateError);
}

BOOST_AUTO_TEST_SUITE_END()
