// SPDX-License-Identifier: Apache-2.0
#include <text/Transliterator.hpp>

#include <catch2/catch_test_macros.hpp>

using namespace srtvoice;

TEST_CASE("containsCyrillic detects Cyrillic letters", "[transliterator]")
{
    CHECK(containsCyrillic("Здраво"));
    CHECK(containsCyrillic("mixed ћ text"));
    CHECK_FALSE(containsCyrillic("Zdravo, svete!"));
    CHECK_FALSE(containsCyrillic("Čačak, Đurđevdan"));
    CHECK_FALSE(containsCyrillic(""));
}

TEST_CASE("toSerbianCyrillic maps single letters", "[transliterator]")
{
    CHECK(toSerbianCyrillic("Zdravo svete") == "Здраво свете");
    CHECK(toSerbianCyrillic("čćđšž ČĆĐŠŽ") == "чћђшж ЧЋЂШЖ");
}

TEST_CASE("toSerbianCyrillic maps digraphs", "[transliterator]")
{
    CHECK(toSerbianCyrillic("ljubav") == "љубав");
    CHECK(toSerbianCyrillic("Njegoš") == "Његош");
    CHECK(toSerbianCyrillic("NJEGOŠ") == "ЊЕГОШ");
    CHECK(toSerbianCyrillic("džep Džep DŽEP") == "џеп Џеп ЏЕП");
    CHECK(toSerbianCyrillic("Ljiljana") == "Љиљана");
}

TEST_CASE("toSerbianCyrillic leaves other characters untouched", "[transliterator]")
{
    CHECK(toSerbianCyrillic("123, ?! - \"x\"") == "123, ?! - \"x\"");
    CHECK(toSerbianCyrillic("Здраво") == "Здраво");
    CHECK(toSerbianCyrillic("").empty());
}

TEST_CASE("Transliterated text is detected as Cyrillic", "[transliterator]")
{
    CHECK(containsCyrillic(toSerbianCyrillic("Dobar dan")));
}
