// From rsfuse

// MIT License

// Copyright (c) 2025 Silimate Inc.

// Permission is hereby granted, free of charge, to any person obtaining a copy
// of this software and associated documentation files (the "Software"), to deal
// in the Software without restriction, including without limitation the rights
// to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
// copies of the Software, and to permit persons to whom the Software is
// furnished to do so, subject to the following conditions:

// The above copyright notice and this permission notice shall be included in all
// copies or substantial portions of the Software.

// THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
// IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
// FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
// AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
// LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
// OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
// SOFTWARE.

#include "errors.hh"
#include "impl_name.hh"

#include <gtest/gtest.h>

using namespace rsfuse;

TEST(ImplBlockName, ComponentsLoseWhitespace) {
	auto name = ImplBlockName::from_components(
		"<T: Copy + Clone + Default, const X: usize, const Y: usize, const N: "
		"usize>",
		std::nullopt,
		"MyMap2D<T, X, Y, N>",
		""
	);
	EXPECT_EQ(
		name.to_string(),
		"impl<T:Copy+Clone+Default,constX:usize,constY:usize,constN:usize> "
		"MyMap2D<T,X,Y,N>"
	);
	EXPECT_FALSE(name.has_trait());
}

TEST(ImplBlockName, TraitAndWhereClause) {
	auto name = ImplBlockName::from_components(
		"<T: Copy, const N: usize>", "Default", "MyArray<T, N>", "T: Display"
	);
	EXPECT_EQ(
		name.to_string(),
		"impl<T:Copy,constN:usize> Default for MyArray<T,N> whereT:Display"
	);
	EXPECT_TRUE(name.has_trait());
}

TEST(ImplBlockName, ParseRoundTripsRenderedName) {
	auto rendered =
		"impl<T:Copy,constN:usize> Default for MyArray<T,N> whereT:Display";
	auto name = ImplBlockName::parse(rendered);
	EXPECT_EQ(name.generics, "<T:Copy,constN:usize>");
	EXPECT_EQ(name.trait_path, "Default");
	EXPECT_EQ(name.type_path, "MyArray<T,N>");
	EXPECT_EQ(name.where_clause, "whereT:Display");
	EXPECT_EQ(name.to_string(), rendered);
}

TEST(ImplBlockName, ParseIgnoresWhitespaceInsideComponents) {
	auto spaced = ImplBlockName::parse(
		"impl< T : Copy , const N : usize > fmt::Display for Go < T , N >"
	);
	auto compact =
		ImplBlockName::parse("impl<T:Copy,constN:usize> fmt::Display for Go<T,N>");
	EXPECT_EQ(spaced, compact);
}

TEST(ImplBlockName, ParseWithoutGenerics) {
	auto name = ImplBlockName::parse("impl Go");
	EXPECT_TRUE(name.generics.empty());
	EXPECT_FALSE(name.has_trait());
	EXPECT_EQ(name.type_path, "Go");
	EXPECT_EQ(name.to_string(), "impl Go");
}

TEST(ImplBlockName, ParseFunctionTypeArrow) {
	auto name = ImplBlockName::parse("impl<F:Fn(u8)->u8> Apply for Wrapper<F>");
	EXPECT_EQ(name.generics, "<F:Fn(u8)->u8>");
	EXPECT_EQ(name.type_path, "Wrapper<F>");
}

TEST(ImplBlockName, ParseRejectsMalformedNames) {
	for (auto text : {"Go", "implGo", "impl", "impl for Go", "impl Display for",
					  "impl<T Go", "impl whereT:Copy"}) {
		try {
			ImplBlockName::parse(text);
			ADD_FAILURE() << "accepted '" << text << "'";
		} catch (FusionError &e) {
			EXPECT_EQ(e.get_kind(), ErrorKind::invalid_config_pattern) << text;
		}
	}
}

TEST(ImplItemPattern, PlainName) {
	auto pattern = ImplItemPattern::parse("set");
	EXPECT_EQ(pattern.item_name, "set");
	EXPECT_FALSE(pattern.block.has_value());
	EXPECT_EQ(pattern.to_string(), "set");
}

TEST(ImplItemPattern, QualifiedName) {
	auto pattern = ImplItemPattern::parse("set@impl<T : Copy> MyMap<T>");
	EXPECT_EQ(pattern.item_name, "set");
	ASSERT_TRUE(pattern.block.has_value());
	EXPECT_EQ(pattern.block->to_string(), "impl<T:Copy> MyMap<T>");
	EXPECT_EQ(pattern.to_string(), "set@impl<T:Copy> MyMap<T>");
}

TEST(ImplItemPattern, Wildcard) {
	auto pattern = ImplItemPattern::parse("*@impl Go");
	EXPECT_TRUE(pattern.is_wildcard());
	EXPECT_EQ(pattern.to_string(), "*@impl Go");
}

TEST(ImplItemPattern, RejectsInvalidPatterns) {
	for (auto text : {"*", "", "@impl Go", "set@impl Go@impl Other",
					  "set@Go", "se-t"}) {
		try {
			ImplItemPattern::parse(text);
			ADD_FAILURE() << "accepted '" << text << "'";
		} catch (FusionError &e) {
			EXPECT_EQ(e.get_kind(), ErrorKind::invalid_config_pattern) << text;
		}
	}
}

TEST(PathSegments, StripsReferencesAndGenerics) {
	EXPECT_EQ(
		path_segments("&'a mut map::MyMap2D<T, X>"),
		(std::vector<std::string>{"map", "MyMap2D"})
	);
	EXPECT_EQ(path_base_name("dyn fmt::Display"), "Display");
	EXPECT_EQ(path_base_name("*const Node"), "Node");
	EXPECT_EQ(path_base_name(""), "");
}
