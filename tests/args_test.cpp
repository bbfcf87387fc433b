#include <gtest/gtest.h>
#include <string>
#include "sapio/args.hpp"
#include "sapio/error.hpp"

using namespace sapio;

namespace {

std::string message_of(llvm::Error err){
    auto rs = take_reasons(std::move(err), ErrorKind::ProductionFailure, {});
    EXPECT_EQ(rs[0].kind, ErrorKind::ArgumentCoercionFailure);
    return rs[0].message;
}

} // namespace

TEST(Args, ReadsTypedFields){
    auto args = edn::parse("{:n -4 :amt 10 :who \"alice\" :ok true :maybe nil}");
    auto n = arg_i64(args, "n");
    ASSERT_TRUE(static_cast<bool>(n));
    EXPECT_EQ(*n, -4);
    auto amt = arg_amount(args, "amt");
    ASSERT_TRUE(static_cast<bool>(amt));
    EXPECT_EQ(*amt, 10);
    auto who = arg_string(args, "who");
    ASSERT_TRUE(static_cast<bool>(who));
    EXPECT_EQ(*who, "alice");
    auto ok = arg_bool(args, "ok");
    ASSERT_TRUE(static_cast<bool>(ok));
    EXPECT_TRUE(*ok);
    EXPECT_TRUE(arg_optional(args, "maybe") == nullptr);
    EXPECT_TRUE(arg_optional(args, "absent") == nullptr);
    EXPECT_TRUE(arg_optional(args, "who") != nullptr);
}

TEST(Args, MissingAndMistypedFieldsAreCoercionFailures){
    auto args = edn::parse("{:n \"four\" :amt -1}");
    auto missing = arg_string(args, "who");
    ASSERT_FALSE(static_cast<bool>(missing));
    EXPECT_EQ(message_of(missing.takeError()), "missing field :who");
    auto wrong = arg_i64(args, "n");
    ASSERT_FALSE(static_cast<bool>(wrong));
    EXPECT_EQ(message_of(wrong.takeError()), "field :n expects an integer, got \"four\"");
    auto negative = arg_amount(args, "amt");
    ASSERT_FALSE(static_cast<bool>(negative));
    EXPECT_EQ(message_of(negative.takeError()), "field :amt must be a non-negative amount");
    auto not_bool = arg_bool(args, "amt");
    ASSERT_FALSE(static_cast<bool>(not_bool));
    EXPECT_NE(message_of(not_bool.takeError()).find("a boolean"), std::string::npos);
}

TEST(Args, U32FieldsAreRangeChecked){
    auto args = edn::parse("{:h 4294967295 :neg -1 :big 4294967296}");
    auto h = arg_u32(args, "h");
    ASSERT_TRUE(static_cast<bool>(h));
    EXPECT_EQ(*h, 0xffffffffu);
    auto neg = arg_u32(args, "neg");
    ASSERT_FALSE(static_cast<bool>(neg));
    EXPECT_EQ(message_of(neg.takeError()), "field :neg out of range");
    auto big = arg_u32(args, "big");
    ASSERT_FALSE(static_cast<bool>(big));
    EXPECT_EQ(message_of(big.takeError()), "field :big out of range");
}

TEST(Args, NonMapArguments){
    auto v = arg_i64(edn::parse("[1 2]"), "n");
    ASSERT_FALSE(static_cast<bool>(v));
    EXPECT_EQ(message_of(v.takeError()), "stateful arguments must be a map");
    auto none = arg_i64(nullptr, "n");
    ASSERT_FALSE(static_cast<bool>(none));
    EXPECT_EQ(message_of(none.takeError()), "stateful arguments must be a map");
}

TEST(Args, EnumVariants){
    auto unit = variant_of(edn::parse(":hold"));
    ASSERT_TRUE(static_cast<bool>(unit));
    EXPECT_EQ(unit->tag, "hold");
    EXPECT_TRUE(unit->payload == nullptr);

    auto with = variant_of(edn::parse("{:make-sale {:price 5}}"));
    ASSERT_TRUE(static_cast<bool>(with));
    EXPECT_EQ(with->tag, "make-sale");
    auto price = arg_amount(with->payload, "price");
    ASSERT_TRUE(static_cast<bool>(price));
    EXPECT_EQ(*price, 5);

    auto two = variant_of(edn::parse("{:a 1 :b 2}"));
    ASSERT_FALSE(static_cast<bool>(two));
    EXPECT_NE(message_of(two.takeError()).find("expected enum variant"), std::string::npos);
    auto str = variant_of(edn::parse("\"hold\""));
    ASSERT_FALSE(static_cast<bool>(str));
    (void)message_of(str.takeError());
}
