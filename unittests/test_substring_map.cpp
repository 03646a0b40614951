#include "substring_map.hpp"
#include <boost/test/unit_test.hpp>
#include <algorithm>
#include <string>
#include <vector>

using pathmux::SubstringMap;

BOOST_AUTO_TEST_SUITE(substring_map_tests)

BOOST_AUTO_TEST_CASE(test_empty)
{
	const SubstringMap<int> m;
	BOOST_TEST(m.size() == 0u);
	BOOST_TEST(m.keys().empty());
	BOOST_TEST(!m.get(""));
	BOOST_TEST(!m.get("/a"));
}

BOOST_AUTO_TEST_CASE(test_put_get)
{
	SubstringMap<int> m;
	m.put("/a", 1);
	m.put("/ab", 2);

	BOOST_TEST(m.size() == 2u);
	auto a = m.get("/a");
	BOOST_TEST_REQUIRE(static_cast<bool>(a));
	BOOST_TEST(a->key() == "/a");
	BOOST_TEST(a->value() == 1);
	BOOST_TEST(m.get("/ab")->value() == 2);
	BOOST_TEST(!m.get("/abc"));
	BOOST_TEST(!m.get("/A"));
}

BOOST_AUTO_TEST_CASE(test_overwrite)
{
	SubstringMap<std::string> m;
	m.put("/a", "first");
	m.put("/a", "second");

	BOOST_TEST(m.size() == 1u);
	BOOST_TEST(m.get("/a")->value() == "second");
}

BOOST_AUTO_TEST_CASE(test_get_substring)
{
	SubstringMap<int> m;
	m.put("/api", 1);

	const std::string path = "/api/v1/users";
	auto found = m.get(path, 4);
	BOOST_TEST_REQUIRE(static_cast<bool>(found));
	BOOST_TEST(found->key() == "/api");
	BOOST_TEST(found->value() == 1);

	BOOST_TEST(!m.get(path, 3));
	BOOST_TEST(!m.get(path, 5));
	BOOST_TEST(!m.get(path, path.size()));
}

BOOST_AUTO_TEST_CASE(test_get_substring_clamped)
{
	SubstringMap<int> m;
	m.put("/a", 1);

	BOOST_TEST(m.get("/a", 100)->value() == 1);
	BOOST_TEST(!m.get("/a", 0));
}

BOOST_AUTO_TEST_CASE(test_keys)
{
	SubstringMap<int> m;
	m.put("/x", 1);
	m.put("/yy", 2);
	m.put("/zzz", 3);
	m.put("/x", 4);

	auto keys = m.keys();
	std::sort(keys.begin(), keys.end());
	const std::vector<std::string> expected = { "/x", "/yy", "/zzz" };
	BOOST_TEST(keys == expected, boost::test_tools::per_element());
}

BOOST_AUTO_TEST_CASE(test_match_outlives_update)
{
	SubstringMap<std::string> m;
	m.put("/a", "old");

	auto before = m.get("/a");
	m.put("/a", "new");
	m.put("/b", "other");

	BOOST_TEST_REQUIRE(static_cast<bool>(before));
	BOOST_TEST(before->key() == "/a");
	BOOST_TEST(before->value() == "old");
	BOOST_TEST(m.get("/a")->value() == "new");
}

BOOST_AUTO_TEST_SUITE_END()
