#define BOOST_TEST_DYN_LINK
#define BOOST_TEST_MODULE LoaderTests

#include <filesystem>
#include <fstream>
#include <string>
#include <unistd.h>
#include <boost/test/unit_test.hpp>
#include "Error.h"
#include "CatalogueLoader.h"

using namespace dragoman;

struct CatalogueDir
{
	std::filesystem::path path;

	CatalogueDir ()
	{
		static int counter = 0;
		path = std::filesystem::temp_directory_path () /
			("dragoman-test-" + std::to_string (::getpid ()) + "-" + std::to_string (counter++));
		std::filesystem::remove_all (path);
		std::filesystem::create_directories (path);
	}

	~CatalogueDir ()
	{
		std::error_code ec;
		std::filesystem::remove_all (path, ec);
	}

	void Write (const std::string& name, const std::string& content)
	{
		std::ofstream f (path / name);
		f << content;
	}
};

BOOST_FIXTURE_TEST_SUITE(LoaderTests, CatalogueDir)

BOOST_AUTO_TEST_CASE(LoadIniAndJson)
{
	Write ("messages.en.ini", "greeting = Hello, {name}!\napples = {1} one apple | {?} apples\n");
	Write ("messages.zh_CN.json", "{ \"greeting\": \"你好, {name}!\" }");
	Write ("errors.en.json", "{ \"oops\": \"Something went wrong\" }");
	Write ("README.txt", "not a catalogue");

	auto bag = loader::LoadDirectory (path.string ());
	BOOST_CHECK_EQUAL(bag.GetNumCatalogues (), 2);

	auto en = bag.Get (Language::English);
	BOOST_REQUIRE(en);
	BOOST_CHECK_EQUAL(*en->Get ("messages", "greeting"), "Hello, {name}!");
	BOOST_CHECK_EQUAL(*en->Get ("messages", "apples"), "{1} one apple | {?} apples");
	BOOST_CHECK_EQUAL(*en->Get ("errors", "oops"), "Something went wrong");

	auto zh = bag.Get (Locale::FromTag ("zh_CN"));
	BOOST_REQUIRE(zh);
	BOOST_CHECK_EQUAL(*zh->Get ("messages", "greeting"), "你好, {name}!");
}

BOOST_AUTO_TEST_CASE(OnlyRequestedExtensions)
{
	Write ("messages.en.ini", "a = from ini\n");
	Write ("messages.fr.json", "{ \"a\": \"du json\" }");

	auto bag = loader::LoadDirectory (path.string (), { loader::CATALOGUE_EXT_JSON });
	BOOST_CHECK_EQUAL(bag.GetNumCatalogues (), 1);
	BOOST_CHECK(bag.Get (Language::French));
	BOOST_CHECK(!bag.Get (Language::English));
}

BOOST_AUTO_TEST_CASE(DottedDomain)
{
	Write ("app.errors.de.ini", "a = Fehler\n");
	auto bag = loader::LoadDirectory (path.string ());
	auto de = bag.Get (Language::German);
	BOOST_REQUIRE(de);
	BOOST_CHECK_EQUAL(*de->Get ("app.errors", "a"), "Fehler");
}

BOOST_AUTO_TEST_CASE(SameLocaleFilesMerge)
{
	Write ("messages.en.ini", "a = A\n");
	Write ("other.en.ini", "b = B\n");
	auto bag = loader::LoadDirectory (path.string ());
	BOOST_REQUIRE_EQUAL(bag.GetNumCatalogues (), 1);
	BOOST_CHECK_EQUAL(bag.Get (Language::English)->GetNumMessages (), 2);
}

BOOST_AUTO_TEST_CASE(MissingDirectory)
{
	BOOST_CHECK_THROW(loader::LoadDirectory ((path / "nowhere").string ()), LoaderError);
}

BOOST_AUTO_TEST_CASE(UnsupportedExtension)
{
	BOOST_CHECK_THROW(loader::LoadDirectory (path.string (), { "yaml" }), LoaderError);
}

BOOST_AUTO_TEST_CASE(BadFileName)
{
	Write ("en.ini", "a = A\n");
	BOOST_CHECK_THROW(loader::LoadDirectory (path.string ()), LoaderError);
}

BOOST_AUTO_TEST_CASE(UnknownLocale)
{
	Write ("messages.xx.ini", "a = A\n");
	try
	{
		loader::LoadDirectory (path.string ());
		BOOST_FAIL("no exception");
	}
	catch (LoaderError& ex)
	{
		BOOST_CHECK(ex.GetPath ().find ("messages.xx.ini") != std::string::npos);
	}
}

BOOST_AUTO_TEST_CASE(NestedEntriesRejected)
{
	Write ("messages.en.json", "{ \"menu\": { \"open\": \"Open\" } }");
	BOOST_CHECK_THROW(loader::LoadDirectory (path.string ()), LoaderError);
}

BOOST_AUTO_TEST_CASE(IniSectionsRejected)
{
	Write ("messages.en.ini", "[menu]\nopen = Open\n");
	BOOST_CHECK_THROW(loader::LoadDirectory (path.string ()), LoaderError);
}

BOOST_AUTO_TEST_CASE(UnparsableFile)
{
	Write ("messages.en.json", "{ \"a\": ");
	BOOST_CHECK_THROW(loader::LoadDirectory (path.string ()), LoaderError);
}

BOOST_AUTO_TEST_CASE(LoadSingleFile)
{
	Write ("anything.json", "{ \"a\": \"A\", \"b\": \"B\" }");
	Catalogue catalogue (Language::Italian);
	loader::LoadFile ((path / "anything.json").string (), "ui", catalogue);
	BOOST_CHECK_EQUAL(catalogue.GetNumMessages (), 2);
	BOOST_CHECK_EQUAL(*catalogue.Get ("ui", "b"), "B");
}

BOOST_AUTO_TEST_SUITE_END()
