/**
 * Unit tests for the worker channel value codec
 */

#include <gtest/gtest.h>
#include "../../src/value_codec.h"
#include "codegate/errors.h"

using namespace codegate;

TEST(ValueCodecTest, JsonNativeValuesTravelAsThemselves) {
    Json::Value encoded = value_codec::encode(Value::list({Value(1), Value("a"), Value(), Value(true)}));

    ASSERT_TRUE(encoded.isArray());
    EXPECT_EQ(encoded[0].asInt64(), 1);
    EXPECT_EQ(encoded[1].asString(), "a");
    EXPECT_TRUE(encoded[2].isNull());
}

TEST(ValueCodecTest, FloatsKeepTheirType) {
    Value decoded = value_codec::decode(value_codec::encode(Value(1.0)));

    EXPECT_TRUE(decoded.is_float());
    EXPECT_EQ(repr(decoded), "1.0");
}

TEST(ValueCodecTest, DictsKeepNonStringKeysAndOrder) {
    Value dict = Value::dict({{Value("z"), Value(1)}, {Value(3), Value(2)},
                              {Value::tuple({Value(1), Value(2)}), Value("t")}});

    Value decoded = value_codec::decode(value_codec::encode(dict));

    EXPECT_EQ(repr(decoded), "{'z': 1, 3: 2, (1, 2): 't'}");
}

TEST(ValueCodecTest, OpaqueAndExceptionValuesSurvive) {
    Value stamp = value_codec::decode(value_codec::encode(Value::opaque("datetime", "2024-05-01")));
    Value error = value_codec::decode(value_codec::encode(Value::exception("KeyError", "x")));

    EXPECT_EQ(to_display(stamp), "2024-05-01");
    EXPECT_EQ(repr(error), "KeyError('x')");
}

TEST(ValueCodecTest, BytesAndRanges) {
    EXPECT_EQ(repr(value_codec::decode(value_codec::encode(Value::bytes("\x01z")))), "b'\\x01z'");
    EXPECT_EQ(repr(value_codec::decode(value_codec::encode(Value::range(0, 10, 2)))), "range(0, 10, 2)");
}

TEST(ValueCodecTest, CyclicValuesAreRejected) {
    Value list = Value::list();
    list.as_list().items.push_back(list);

    EXPECT_THROW(value_codec::encode(list), SerializationError);

    list.as_list().items.clear();
}

TEST(ValueCodecTest, MalformedInputIsRejected) {
    Json::Value unknown(Json::objectValue);
    unknown["$t"] = "mystery";
    Json::Value untagged(Json::objectValue);
    untagged["a"] = 1;
    Json::Value bad_range(Json::objectValue);
    bad_range["$t"] = "range";
    bad_range["v"] = Json::Value(Json::arrayValue);

    EXPECT_THROW(value_codec::decode(unknown), SerializationError);
    EXPECT_THROW(value_codec::decode(untagged), SerializationError);
    EXPECT_THROW(value_codec::decode(bad_range), SerializationError);
}
