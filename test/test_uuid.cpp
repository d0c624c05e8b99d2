#include "BLEUUID.h"
#include "BLEErrors.h"

#include <gtest/gtest.h>

using namespace GattLink::BLE;

TEST(BLEUUID, ShortAliasExpandsOntoBaseUUID) {
    BLEUUID id;
    ASSERT_TRUE(BLEUUID::parse("2a37", id));
    EXPECT_EQ("00002a37-0000-1000-8000-00805f9b34fb", id.toString());
    EXPECT_TRUE(id.isShort());
    EXPECT_EQ(0x2a37, id.toShort());
}

TEST(BLEUUID, AllTextFormsNormalizeToSameValue) {
    BLEUUID expected = BLEUUID::fromShort(0x180d);

    const char* forms[] = {
        "180d",
        "180D",
        "0x180d",
        "0000180d",
        "0000180d00001000800000805f9b34fb",
        "0000180d-0000-1000-8000-00805f9b34fb",
        "0000180D-0000-1000-8000-00805F9B34FB",
        "{0000180d-0000-1000-8000-00805f9b34fb}",
        "urn:uuid:0000180d-0000-1000-8000-00805f9b34fb",
        "  180d  ",
    };

    for (const char* form : forms) {
        BLEUUID parsed;
        ASSERT_TRUE(BLEUUID::parse(form, parsed)) << form;
        EXPECT_EQ(expected, parsed) << form;
    }
}

TEST(BLEUUID, ThirtyTwoBitAlias) {
    BLEUUID id = BLEUUID::fromString("12345678");
    EXPECT_EQ("12345678-0000-1000-8000-00805f9b34fb", id.toString());
    EXPECT_FALSE(id.isShort());
    EXPECT_EQ(BLEUUID::fromShort32(0x12345678), id);
}

TEST(BLEUUID, VendorUUIDRoundTripsCanonicalText) {
    const std::string text = "a1e8f5b1-696b-4e4c-87c6-69dfe0b0093b";
    BLEUUID id = BLEUUID::fromString(text);
    EXPECT_EQ(text, id.toString());
    EXPECT_FALSE(id.isShort());
}

TEST(BLEUUID, RejectsMalformedText) {
    const char* bad[] = {
        "",
        "2a3",
        "2a37a",
        "xyz1",
        "0000180d-0000-1000-8000-00805f9b34f",
        "0000180d0-000-1000-8000-00805f9b34fb",
        "0000180d-0000-1000-8000-00805f9b34fg",
        "{0000180d-0000-1000-8000-00805f9b34fb",
        "{2a37}",
        "urn:uuid:2a37",
        "{0000180d00001000800000805f9b34fb}",
        "urn:uuid:0000180d",
    };

    for (const char* text : bad) {
        BLEUUID untouched = BLEUUID::fromShort(0xbeef);
        EXPECT_FALSE(BLEUUID::parse(text, untouched)) << text;
        EXPECT_EQ(BLEUUID::fromShort(0xbeef), untouched) << text;
    }
}

TEST(BLEUUID, FromStringThrowsInvalidUUIDError) {
    try {
        BLEUUID::fromString("not-a-uuid");
        FAIL() << "expected InvalidUUIDError";
    } catch (const InvalidUUIDError& e) {
        EXPECT_EQ("not-a-uuid", e.text());
        EXPECT_NE(std::string::npos, std::string(e.what()).find("not-a-uuid"));
    }
}

TEST(BLEUUID, OrderingAndNil) {
    BLEUUID nil;
    EXPECT_TRUE(nil.isNil());
    EXPECT_FALSE(BLEUUID::fromShort(1).isNil());

    EXPECT_TRUE(BLEUUID::fromShort(0x2a19) < BLEUUID::fromShort(0x2a37));
    EXPECT_FALSE(BLEUUID::fromShort(0x2a37) < BLEUUID::fromShort(0x2a19));
    EXPECT_NE(BLEUUID::fromShort(0x2a19), BLEUUID::fromShort(0x2a37));
}
