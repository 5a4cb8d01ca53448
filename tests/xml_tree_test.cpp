#include <gtest/gtest.h>
#include "util/xml_tree.hpp"

TEST(XmlTreeTest, BuildsElementTree) {
    std::string error;
    auto root = XmlTree::parse("<a><b> text </b><c><d>1</d></c></a>", error);

    ASSERT_TRUE(root.has_value()) << error;
    EXPECT_EQ(root->name, "a");
    ASSERT_EQ(root->children.size(), 2u);

    const XmlElement* b = root->child("b");
    ASSERT_NE(b, nullptr);
    EXPECT_EQ(b->text, "text");
    EXPECT_TRUE(b->isLeaf());

    const XmlElement* c = root->child("c");
    ASSERT_NE(c, nullptr);
    EXPECT_FALSE(c->isLeaf());
    EXPECT_EQ(c->child("d")->text, "1");
    EXPECT_EQ(root->child("missing"), nullptr);
}

TEST(XmlTreeTest, ReportsSyntaxErrorsWithLine) {
    std::string error;
    auto root = XmlTree::parse("<a>\n<b></a>", error);

    EXPECT_FALSE(root.has_value());
    EXPECT_NE(error.find("line 2"), std::string::npos);
}

TEST(XmlTreeTest, RejectsEmptyDocument) {
    std::string error;
    EXPECT_FALSE(XmlTree::parse("", error).has_value());
    EXPECT_FALSE(error.empty());
}

TEST(XmlTreeTest, RefusesEntityDeclarations) {
    std::string error;
    auto root = XmlTree::parse(
        "<?xml version=\"1.0\"?>"
        "<!DOCTYPE a [<!ENTITY boom \"boom\">]>"
        "<a>&boom;</a>", error);

    EXPECT_FALSE(root.has_value());
    EXPECT_EQ(error, "Entity declarations are not allowed");
}

TEST(XmlTreeTest, NamespacesAreStrippedFromNames) {
    std::string error;
    auto root = XmlTree::parse(
        "<u:envelope xmlns:u=\"urn:lge:udap\">"
        "<device xmlns=\"urn:schemas-upnp-org:device-1-0\"><u:modelName>X</u:modelName></device>"
        "</u:envelope>", error);

    ASSERT_TRUE(root.has_value()) << error;
    EXPECT_EQ(root->name, "envelope");
    ASSERT_NE(root->child("device"), nullptr);
    EXPECT_EQ(root->child("device")->child("modelName")->text, "X");
}

TEST(XmlTreeTest, EscapesMarkupCharacters) {
    EXPECT_EQ(XmlTree::escape("123456"), "123456");
    EXPECT_EQ(XmlTree::escape("a<b>&\"c'"), "a&lt;b&gt;&amp;&quot;c&apos;");
}
