#include <cstdint>
#include <string>
#include <unity.h>
#include "channelhash.hpp"

using namespace meshslot;

void test_hash_empty(void)
{
    TEST_ASSERT_EQUAL_UINT32(5381, hashChannelName(""));
}

void test_hash_presets(void)
{
    TEST_ASSERT_EQUAL_UINT32(177670, hashChannelName("a"));
    TEST_ASSERT_EQUAL_UINT32(130429955, hashChannelName("LongFast"));
    TEST_ASSERT_EQUAL_UINT32(130908986, hashChannelName("LongSlow"));
    TEST_ASSERT_EQUAL_UINT32(1461075348, hashChannelName("MediumFast"));
    TEST_ASSERT_EQUAL_UINT32(2758524545u, hashChannelName("ShortTurbo"));
}

void test_hash_wraps_every_step(void)
{
    // overflows 32 bits several times along the way
    TEST_ASSERT_EQUAL_UINT32(871026367, hashChannelName("MeshtasticChannel_0123456789"));

    std::string longName;
    for (int i = 0; i < 8; i++)
        longName += "LongFast";
    TEST_ASSERT_EQUAL_UINT32(61625589, hashChannelName(longName));
}

void test_hash_deterministic(void)
{
    const std::string name = "LongFast";
    uint32_t first = hashChannelName(name);
    for (int i = 0; i < 100; i++)
        TEST_ASSERT_EQUAL_UINT32(first, hashChannelName(name));
}

void test_hash_code_points(void)
{
    // U+00E9, U+65E5 U+672C, U+1F600
    TEST_ASSERT_EQUAL_UINT32(177806, hashChannelName("\xc3\xa9"));
    TEST_ASSERT_EQUAL_UINT32(6747126, hashChannelName("\xe6\x97\xa5\xe6\x9c\xac"));
    TEST_ASSERT_EQUAL_UINT32(306085, hashChannelName("\xf0\x9f\x98\x80"));
    TEST_ASSERT_EQUAL_UINT32(1015193382, hashChannelName("\xc3\x9c" "n" "\xc3\xaf" "c" "\xc3\xb8" "d" "\xc3\xa9"));
}

void test_hash_malformed_utf8(void)
{
    // stray bytes hash as U+DC80..U+DCFF, one escape per byte
    TEST_ASSERT_EQUAL_UINT32(234126, hashChannelName("\xe9"));
    TEST_ASSERT_NOT_EQUAL(hashChannelName("\xc3\xa9"), hashChannelName("\xe9"));
    TEST_ASSERT_EQUAL_UINT32(234148, hashChannelName("\xff"));
    TEST_ASSERT_EQUAL_UINT32(234088, hashChannelName("\xc3"));
    TEST_ASSERT_EQUAL_UINT32(djb2Step(DJB2_SEED, 0xDCFF), hashChannelName("\xff"));
    // truncated 4 byte sequence
    TEST_ASSERT_EQUAL_UINT32(256891116, hashChannelName("\xf0\x9f\x98"));
    // encoded surrogate
    TEST_ASSERT_EQUAL_UINT32(256887858, hashChannelName("\xed\xa0\x80"));
    // decoding resumes right after the bad byte
    TEST_ASSERT_EQUAL_UINT32(195348977, hashChannelName("a\xe9" "b"));
}

void test_hash_step(void)
{
    TEST_ASSERT_EQUAL_UINT32(DJB2_SEED * 33 + 'a', djb2Step(DJB2_SEED, 'a'));
    TEST_ASSERT_EQUAL_UINT32(0xFFFFFFFFu * 33u + 1u, djb2Step(0xFFFFFFFFu, 1));
}

void setUp() {}
void tearDown() {}

int main(int argc, char **argv)
{
    UNITY_BEGIN();
    RUN_TEST(test_hash_empty);
    RUN_TEST(test_hash_presets);
    RUN_TEST(test_hash_wraps_every_step);
    RUN_TEST(test_hash_deterministic);
    RUN_TEST(test_hash_code_points);
    RUN_TEST(test_hash_malformed_utf8);
    RUN_TEST(test_hash_step);
    return UNITY_END();
}
