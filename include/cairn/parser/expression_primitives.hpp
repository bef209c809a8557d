#pragma once

#include <tao/pegtl.hpp>

namespace cairn::parser::expr {

namespace pegtl = tao::pegtl;

struct line_comment : pegtl::seq<pegtl::string<'-', '-'>, pegtl::until<pegtl::eolf>> {
};

struct block_comment : pegtl::seq<pegtl::string<'/', '*'>, pegtl::until<pegtl::string<'*', '/'>>> {
};

struct separator : pegtl::sor<pegtl::space, line_comment, block_comment> {
};

struct optional_space : pegtl::star<separator> {
};

template <char... Cs>
struct keyword : pegtl::seq<pegtl::istring<Cs...>, pegtl::not_at<pegtl::identifier_other>> {
};

struct string_literal_char : pegtl::sor<pegtl::seq<pegtl::one<'\''>, pegtl::one<'\''>>, pegtl::not_one<'\''>> {
};

struct string_literal : pegtl::seq<pegtl::one<'\''>, pegtl::star<string_literal_char>, pegtl::one<'\''>> {
};

struct fractional_part : pegtl::seq<pegtl::one<'.'>, pegtl::plus<pegtl::digit>> {
};

struct numeric_literal : pegtl::seq<pegtl::plus<pegtl::digit>, pegtl::opt<fractional_part>, pegtl::not_at<pegtl::identifier_other>> {
};

struct signed_numeric_literal : pegtl::seq<pegtl::opt<pegtl::one<'+', '-'>>, numeric_literal> {
};

struct quoted_identifier : pegtl::seq<pegtl::one<'"'>, pegtl::plus<pegtl::not_one<'"'>>, pegtl::one<'"'>> {
};

}  // namespace cairn::parser::expr
