#include <gtest/gtest.h>

#include <string>
#include <utility>
#include <vector>

#include "picoosc/Bundle.h"
#include "picoosc/Exceptions.h"
#include "picoosc/Message.h"

using namespace picoosc;

TEST(Value, TypesAndTags) {
    EXPECT_EQ(Value(42).typeTag(), 'i');
    EXPECT_EQ(Value(1.5f).typeTag(), 'f');
    EXPECT_EQ(Value("text").typeTag(), 's');
    EXPECT_EQ(Value(Blob(std::vector<std::byte>(3))).typeTag(), 'b');
    EXPECT_EQ(Value(true).typeTag(), 'T');
    EXPECT_EQ(Value(false).typeTag(), 'F');
    EXPECT_EQ(Value::nil().typeTag(), 'N');
    EXPECT_EQ(Value(Value::Array{1, 2}).typeTag(), '[');
}

TEST(Value, Accessors) {
    Value number(7);
    EXPECT_TRUE(number.isInt32());
    EXPECT_EQ(number.asInt32(), 7);
    EXPECT_THROW(number.asString(), TypeMismatchException);
    EXPECT_THROW(number.asFloat(), TypeMismatchException);

    Value text(std::string("hello"));
    EXPECT_EQ(text.asString(), "hello");
    EXPECT_THROW(text.asInt32(), TypeMismatchException);

    EXPECT_TRUE(Value().isNil());
    EXPECT_THROW(Value().asBool(), TypeMismatchException);
}

TEST(Value, Equality) {
    EXPECT_EQ(Value(1), Value(1));
    EXPECT_NE(Value(1), Value(1.0f));
    EXPECT_NE(Value(1), Value("1"));
    EXPECT_EQ(Value(Value::Array{1, "a"}), Value(Value::Array{1, "a"}));
}

TEST(Value, ToString) {
    EXPECT_EQ(Value(42).toString(), "42");
    EXPECT_EQ(Value("x").toString(), "\"x\"");
    EXPECT_EQ(Value(true).toString(), "true");
    EXPECT_EQ(Value().toString(), "nil");
    EXPECT_EQ(Value(Value::Array{1, 2}).toString(), "[1, 2]");
}

TEST(Message, Construction) {
    Message message("/test/path");
    EXPECT_EQ(message.getAddress(), "/test/path");
    EXPECT_EQ(message.getArgumentCount(), 0u);

    Message withArgs("/some/addr", {"Hey this is something"});
    ASSERT_EQ(withArgs.getArgumentCount(), 1u);
    EXPECT_EQ(withArgs.getArgument(0).asString(), "Hey this is something");
}

TEST(Message, InvalidAddress) {
    EXPECT_THROW(Message(""), AddressException);
    EXPECT_THROW(Message("no/slash"), AddressException);
    EXPECT_THROW(Message("x", {1}), AddressException);
    EXPECT_THROW(Message("/caf\xc3\xa9"), AddressException);
    EXPECT_THROW(Message("/\x80"), AddressException);
}

TEST(Message, Builders) {
    const char raw[] = "abc";
    Message message("/build");
    message.addInt32(1).addFloat(2.0f).addString("three").addBlob(raw, 3).addBool(true).addNil().addArray(
        {Value(5)});

    ASSERT_EQ(message.getArgumentCount(), 7u);
    EXPECT_EQ(message.getArgument(0).asInt32(), 1);
    EXPECT_FLOAT_EQ(message.getArgument(1).asFloat(), 2.0f);
    EXPECT_EQ(message.getArgument(2).asString(), "three");
    EXPECT_EQ(message.getArgument(3).asBlob().size(), 3u);
    EXPECT_TRUE(message.getArgument(4).asBool());
    EXPECT_TRUE(message.getArgument(5).isNil());
    EXPECT_EQ(message.getArgument(6).asArray().size(), 1u);

    EXPECT_THROW(message.getArgument(7), InvalidArgumentException);
}

TEST(Message, Equality) {
    EXPECT_EQ(Message("/a", {1, "x"}), Message("/a", {1, "x"}));
    EXPECT_NE(Message("/a", {1}), Message("/b", {1}));
    EXPECT_NE(Message("/a", {1}), Message("/a", {2}));
}

TEST(Bundle, ElementsKeepOrder) {
    Bundle inner;
    inner.addMessage(Message("/inner"));

    Bundle bundle(TimeTag(1u, 2u));
    bundle.addMessage(Message("/first")).addBundle(inner).addMessage(Message("/last"));

    EXPECT_EQ(bundle.size(), 3u);
    EXPECT_FALSE(bundle.isEmpty());
    EXPECT_EQ(bundle.getTimeTag(), TimeTag(1u, 2u));
    EXPECT_TRUE(std::holds_alternative<Message>(bundle.elements()[0]));
    EXPECT_TRUE(std::holds_alternative<Bundle>(bundle.elements()[1]));

    std::vector<std::string> visited;
    bundle.forEach([&visited](const Message &message) { visited.push_back(message.getAddress()); });
    std::vector<std::string> expected = {"/first", "/inner", "/last"};
    EXPECT_EQ(visited, expected);
}

TEST(Bundle, MovedElementsKeepContent) {
    Bundle child(TimeTag(5u, 6u));
    child.addMessage(Message("/child", {1}));

    Message message("/moved", {"text"});

    Bundle parent;
    parent.addMessage(std::move(message)).addBundle(std::move(child));

    ASSERT_EQ(parent.size(), 2u);
    EXPECT_EQ(std::get<Message>(parent.elements()[0]), Message("/moved", {"text"}));

    const Bundle &inner = std::get<Bundle>(parent.elements()[1]);
    EXPECT_EQ(inner.getTimeTag(), TimeTag(5u, 6u));
    ASSERT_EQ(inner.size(), 1u);
    EXPECT_EQ(std::get<Message>(inner.elements()[0]).getAddress(), "/child");
}

TEST(Bundle, DefaultIsImmediate) {
    Bundle bundle;
    EXPECT_TRUE(bundle.isEmpty());
    EXPECT_TRUE(bundle.getTimeTag().isImmediate());
}

TEST(Exceptions, CodesAndDescriptions) {
    try {
        Message("bad");
        FAIL() << "Expected AddressException";
    } catch (const OSCException &e) {
        EXPECT_EQ(e.code(), OSCException::ErrorCode::AddressError);
    }

    EXPECT_EQ(DecodeError("x").code(), OSCException::ErrorCode::DecodeError);
    EXPECT_EQ(OSCException::getErrorDescription(OSCException::ErrorCode::BindError),
              "Failed to bind server socket");
    EXPECT_EQ(OSCException::getErrorDescription(OSCException::ErrorCode::None), "No error");
}
