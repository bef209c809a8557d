#include "cairn/parser/grammar.hpp"
#include "cairn/parser/expression_primitives.hpp"

#include <tao/pegtl.hpp>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdlib>
#include <optional>
#include <string>
#include <type_traits>
#include <unordered_set>
#include <utility>

namespace cairn::parser {
namespace {

namespace pegtl = tao::pegtl;

using expr::keyword;
using sp = expr::optional_space;

struct kw_select : keyword<'S', 'E', 'L', 'E', 'C', 'T'> {};
struct kw_from : keyword<'F', 'R', 'O', 'M'> {};
struct kw_where : keyword<'W', 'H', 'E', 'R', 'E'> {};
struct kw_and : keyword<'A', 'N', 'D'> {};
struct kw_or : keyword<'O', 'R'> {};
struct kw_not : keyword<'N', 'O', 'T'> {};
struct kw_is : keyword<'I', 'S'> {};
struct kw_null : keyword<'N', 'U', 'L', 'L'> {};
struct kw_true : keyword<'T', 'R', 'U', 'E'> {};
struct kw_false : keyword<'F', 'A', 'L', 'S', 'E'> {};
struct kw_in : keyword<'I', 'N'> {};
struct kw_exists : keyword<'E', 'X', 'I', 'S', 'T', 'S'> {};
struct kw_between : keyword<'B', 'E', 'T', 'W', 'E', 'E', 'N'> {};
struct kw_as : keyword<'A', 'S'> {};
struct kw_join : keyword<'J', 'O', 'I', 'N'> {};
struct kw_inner : keyword<'I', 'N', 'N', 'E', 'R'> {};
struct kw_left : keyword<'L', 'E', 'F', 'T'> {};
struct kw_outer : keyword<'O', 'U', 'T', 'E', 'R'> {};
struct kw_on : keyword<'O', 'N'> {};
struct kw_limit : keyword<'L', 'I', 'M', 'I', 'T'> {};
struct kw_offset : keyword<'O', 'F', 'F', 'S', 'E', 'T'> {};
struct kw_insert : keyword<'I', 'N', 'S', 'E', 'R', 'T'> {};
struct kw_into : keyword<'I', 'N', 'T', 'O'> {};
struct kw_values : keyword<'V', 'A', 'L', 'U', 'E', 'S'> {};
struct kw_update : keyword<'U', 'P', 'D', 'A', 'T', 'E'> {};
struct kw_set : keyword<'S', 'E', 'T'> {};
struct kw_delete : keyword<'D', 'E', 'L', 'E', 'T', 'E'> {};
struct kw_create : keyword<'C', 'R', 'E', 'A', 'T', 'E'> {};
struct kw_table : keyword<'T', 'A', 'B', 'L', 'E'> {};
struct kw_view : keyword<'V', 'I', 'E', 'W'> {};
struct kw_index : keyword<'I', 'N', 'D', 'E', 'X'> {};
struct kw_schema : keyword<'S', 'C', 'H', 'E', 'M', 'A'> {};
struct kw_drop : keyword<'D', 'R', 'O', 'P'> {};
struct kw_default : keyword<'D', 'E', 'F', 'A', 'U', 'L', 'T'> {};
struct kw_if : keyword<'I', 'F'> {};
struct kw_begin : keyword<'B', 'E', 'G', 'I', 'N'> {};
struct kw_commit : keyword<'C', 'O', 'M', 'M', 'I', 'T'> {};
struct kw_rollback : keyword<'R', 'O', 'L', 'L', 'B', 'A', 'C', 'K'> {};
struct kw_transaction : keyword<'T', 'R', 'A', 'N', 'S', 'A', 'C', 'T', 'I', 'O', 'N'> {};

struct reserved_word
    : pegtl::sor<kw_select, kw_from, kw_where, kw_and, kw_or, kw_not, kw_is, kw_null, kw_true, kw_false, kw_in,
                 kw_exists, kw_between, kw_as, kw_join, kw_inner, kw_left, kw_outer, kw_on, kw_limit, kw_offset,
                 kw_insert, kw_into, kw_values, kw_update, kw_set, kw_delete, kw_create, kw_table, kw_drop,
                 kw_default, kw_if, kw_begin, kw_commit, kw_rollback> {};

struct bare_identifier : pegtl::seq<pegtl::not_at<reserved_word>, pegtl::identifier> {};
struct identifier_rule : pegtl::sor<expr::quoted_identifier, bare_identifier> {};
struct qualified_name_rule : pegtl::seq<identifier_rule, pegtl::star<sp, pegtl::one<'.'>, sp, identifier_rule>> {};
struct comma : pegtl::seq<sp, pegtl::one<','>, sp> {};

// Expressions, lowest precedence last.
struct expression;
struct query_body;
struct unary_expression;
struct not_expression;

struct numeric_literal_rule : expr::numeric_literal {};
struct string_literal_rule : expr::string_literal {};
struct true_literal : kw_true {};
struct false_literal : kw_false {};
struct null_literal : kw_null {};
struct column_reference : qualified_name_rule {};

struct query_open : pegtl::success {};
struct subquery_body : pegtl::seq<query_body> {};
struct subquery_rule
    : pegtl::seq<pegtl::one<'('>, sp, pegtl::at<kw_select>, query_open, pegtl::must<subquery_body, sp, pegtl::one<')'>>> {};
struct scalar_subquery : pegtl::seq<subquery_rule> {};
struct exists_expression : pegtl::seq<kw_exists, sp, pegtl::must<subquery_rule>> {};
struct nested_expression : pegtl::seq<expression> {};
struct parenthesized_expression
    : pegtl::seq<pegtl::one<'('>, sp, nested_expression, sp, pegtl::must<pegtl::one<')'>>> {};

struct primary_expression
    : pegtl::sor<numeric_literal_rule, string_literal_rule, true_literal, false_literal, null_literal,
                 exists_expression, scalar_subquery, parenthesized_expression, column_reference> {};

struct signed_operand : pegtl::seq<unary_expression> {};
struct unary_minus : pegtl::seq<pegtl::one<'-'>, sp, signed_operand> {};
struct unary_plus : pegtl::seq<pegtl::one<'+'>, sp, signed_operand> {};
struct unary_expression : pegtl::sor<unary_minus, unary_plus, primary_expression> {};

struct multiply_tail : pegtl::seq<sp, pegtl::one<'*'>, sp, pegtl::must<unary_expression>> {};
struct divide_tail : pegtl::seq<sp, pegtl::one<'/'>, sp, pegtl::must<unary_expression>> {};
struct multiplicative_expression : pegtl::seq<unary_expression, pegtl::star<pegtl::sor<multiply_tail, divide_tail>>> {};

struct add_tail : pegtl::seq<sp, pegtl::one<'+'>, sp, pegtl::must<multiplicative_expression>> {};
struct subtract_tail : pegtl::seq<sp, pegtl::one<'-'>, sp, pegtl::must<multiplicative_expression>> {};
struct additive_expression : pegtl::seq<multiplicative_expression, pegtl::star<pegtl::sor<add_tail, subtract_tail>>> {};

struct comparison_operator
    : pegtl::sor<pegtl::string<'<', '='>, pegtl::string<'>', '='>, pegtl::string<'<', '>'>, pegtl::string<'!', '='>,
                 pegtl::one<'<'>, pegtl::one<'>'>, pegtl::one<'='>> {};
struct comparison_tail : pegtl::seq<sp, comparison_operator, sp, pegtl::must<additive_expression>> {};

struct is_not_null_tail : pegtl::seq<sp, kw_is, sp, kw_not, sp, kw_null> {};
struct is_null_tail : pegtl::seq<sp, kw_is, sp, kw_null> {};

struct between_bounds : pegtl::seq<additive_expression, sp, kw_and, sp, additive_expression> {};
struct not_between_tail : pegtl::seq<sp, kw_not, sp, kw_between, sp, pegtl::must<between_bounds>> {};
struct between_tail : pegtl::seq<sp, kw_between, sp, pegtl::must<between_bounds>> {};

struct list_open : pegtl::one<'('> {};
struct in_list_items : pegtl::list<expression, comma> {};
struct in_list_body : pegtl::seq<list_open, sp, in_list_items, sp, pegtl::one<')'>> {};
struct not_in_subquery_tail : pegtl::seq<sp, kw_not, sp, kw_in, sp, subquery_rule> {};
struct in_subquery_tail : pegtl::seq<sp, kw_in, sp, subquery_rule> {};
struct not_in_list_tail : pegtl::seq<sp, kw_not, sp, kw_in, sp, pegtl::must<in_list_body>> {};
struct in_list_tail : pegtl::seq<sp, kw_in, sp, pegtl::must<in_list_body>> {};

struct predicate_tail
    : pegtl::sor<comparison_tail, is_not_null_tail, is_null_tail, not_between_tail, between_tail, not_in_subquery_tail,
                 in_subquery_tail, not_in_list_tail, in_list_tail> {};
struct predicate : pegtl::seq<additive_expression, pegtl::opt<predicate_tail>> {};

struct negated_operand : pegtl::seq<not_expression> {};
struct negation : pegtl::seq<kw_not, sp, pegtl::must<negated_operand>> {};
struct not_expression : pegtl::sor<negation, predicate> {};

struct and_tail : pegtl::seq<sp, kw_and, sp, pegtl::must<not_expression>> {};
struct and_expression : pegtl::seq<not_expression, pegtl::star<and_tail>> {};

struct or_tail : pegtl::seq<sp, kw_or, sp, pegtl::must<and_expression>> {};
struct expression : pegtl::seq<and_expression, pegtl::star<or_tail>> {};

// SELECT
struct qualified_star_item : pegtl::seq<identifier_rule, sp, pegtl::one<'.'>, sp, pegtl::one<'*'>> {};
struct star_item : pegtl::one<'*'> {};
struct alias_identifier : identifier_rule {};
struct select_alias : pegtl::seq<sp, pegtl::opt<kw_as, sp>, alias_identifier> {};
struct expression_item : pegtl::seq<expression, pegtl::opt<select_alias>> {};
struct select_item : pegtl::sor<qualified_star_item, star_item, expression_item> {};
struct select_list : pegtl::list<select_item, comma> {};

struct table_name : qualified_name_rule {};
struct table_alias : identifier_rule {};
struct table_factor : pegtl::seq<table_name, pegtl::opt<sp, pegtl::opt<kw_as, sp>, table_alias>> {};
struct left_join_keywords : pegtl::seq<kw_left, pegtl::opt<sp, kw_outer>, sp, kw_join> {};
struct inner_join_keywords : pegtl::seq<pegtl::opt<kw_inner, sp>, kw_join> {};
struct join_on : pegtl::seq<kw_on, sp, pegtl::must<expression>> {};
struct join_clause
    : pegtl::seq<pegtl::sor<left_join_keywords, inner_join_keywords>, sp, pegtl::must<table_factor, sp, join_on>> {};
struct from_clause : pegtl::seq<kw_from, sp, pegtl::must<table_factor>, pegtl::star<sp, join_clause>> {};

struct where_clause : pegtl::seq<kw_where, sp, pegtl::must<expression>> {};
struct limit_clause : pegtl::seq<kw_limit, sp, pegtl::must<expression>> {};
struct offset_clause : pegtl::seq<kw_offset, sp, pegtl::must<expression>> {};

struct query_body
    : pegtl::seq<kw_select, sp, pegtl::must<select_list>, pegtl::opt<sp, from_clause>, pegtl::opt<sp, where_clause>,
                 pegtl::opt<sp, limit_clause>, pegtl::opt<sp, offset_clause>> {};

struct select_statement : pegtl::seq<pegtl::at<kw_select>, query_open, pegtl::must<query_body>> {};

// CREATE TABLE
struct if_not_exists : pegtl::seq<kw_if, sp, kw_not, sp, kw_exists> {};
struct create_table_name : qualified_name_rule {};
struct column_name : identifier_rule {};
struct type_word : pegtl::plus<pegtl::identifier_other> {};
struct type_length : pegtl::seq<pegtl::one<'('>, sp, pegtl::plus<pegtl::digit>, sp, pegtl::one<')'>> {};
struct type_name : pegtl::seq<type_word, pegtl::opt<sp, type_length>> {};
struct not_null_option : pegtl::seq<kw_not, sp, kw_null> {};
struct null_option : kw_null {};
struct default_numeric : expr::signed_numeric_literal {};
struct default_string : expr::string_literal {};
struct default_true : kw_true {};
struct default_false : kw_false {};
struct default_null : kw_null {};
struct default_value : pegtl::sor<default_numeric, default_string, default_true, default_false, default_null> {};
struct default_option : pegtl::seq<kw_default, sp, pegtl::must<default_value>> {};
struct column_option : pegtl::sor<not_null_option, null_option, default_option> {};
struct column_definition : pegtl::seq<column_name, sp, pegtl::must<type_name>, pegtl::star<sp, column_option>> {};
struct column_definition_list
    : pegtl::seq<pegtl::one<'('>, sp, pegtl::list<column_definition, comma>, sp, pegtl::one<')'>> {};
struct create_table_statement
    : pegtl::seq<kw_create, sp, kw_table, sp,
                 pegtl::must<pegtl::opt<if_not_exists, sp>, create_table_name, sp, column_definition_list>> {};

// INSERT
struct insert_table_name : qualified_name_rule {};
struct insert_column : identifier_rule {};
struct insert_column_list : pegtl::seq<pegtl::one<'('>, sp, pegtl::list<insert_column, comma>, sp, pegtl::one<')'>> {};
struct values_open : pegtl::one<'('> {};
struct values_row : pegtl::seq<values_open, sp, pegtl::list<expression, comma>, sp, pegtl::one<')'>> {};
struct insert_statement
    : pegtl::seq<kw_insert, sp,
                 pegtl::must<kw_into, sp, insert_table_name, pegtl::opt<sp, insert_column_list>, sp, kw_values, sp,
                             pegtl::list<values_row, comma>>> {};

// UPDATE / DELETE
struct dml_where_clause : pegtl::seq<kw_where, sp, pegtl::must<expression>> {};
struct update_table_name : qualified_name_rule {};
struct assignment_column : identifier_rule {};
struct assignment : pegtl::seq<assignment_column, sp, pegtl::one<'='>, sp, pegtl::must<expression>> {};
struct update_statement
    : pegtl::seq<kw_update, sp,
                 pegtl::must<update_table_name, sp, kw_set, sp, pegtl::list<assignment, comma>,
                             pegtl::opt<sp, dml_where_clause>>> {};

struct delete_table_name : qualified_name_rule {};
struct delete_statement
    : pegtl::seq<kw_delete, sp, pegtl::must<kw_from, sp, delete_table_name, pegtl::opt<sp, dml_where_clause>>> {};

// DROP
struct drop_table_kind : kw_table {};
struct drop_view_kind : kw_view {};
struct drop_index_kind : kw_index {};
struct drop_schema_kind : kw_schema {};
struct drop_object_type : pegtl::sor<drop_table_kind, drop_view_kind, drop_index_kind, drop_schema_kind> {};
struct if_exists : pegtl::seq<kw_if, sp, kw_exists> {};
struct drop_name : qualified_name_rule {};
struct drop_statement
    : pegtl::seq<kw_drop, sp, pegtl::must<drop_object_type, sp, pegtl::opt<if_exists, sp>, pegtl::list<drop_name, comma>>> {};

// Transactions
struct begin_statement : pegtl::seq<kw_begin, pegtl::opt<sp, kw_transaction>> {};
struct commit_statement : pegtl::seq<kw_commit, pegtl::opt<sp, kw_transaction>> {};
struct rollback_statement : pegtl::seq<kw_rollback, pegtl::opt<sp, kw_transaction>> {};

struct statement
    : pegtl::sor<create_table_statement, select_statement, insert_statement, update_statement, delete_statement,
                 drop_statement, begin_statement, commit_statement, rollback_statement> {};
struct statement_terminator : pegtl::sor<pegtl::one<';'>, pegtl::at<pegtl::eof>> {};
struct script_grammar
    : pegtl::seq<sp, pegtl::star<pegtl::sor<pegtl::seq<statement, sp, statement_terminator>, pegtl::one<';'>>, sp>,
                 pegtl::must<pegtl::eof>> {};

struct ParseState final {
    AstArena* arena = nullptr;
    std::vector<Statement>* statements = nullptr;

    std::vector<Expression*> expression_stack{};
    std::vector<std::size_t> list_marks{};
    std::vector<BinaryOperator> operator_stack{};
    std::vector<QuerySpecification*> query_frames{};
    QuerySpecification* completed_query = nullptr;
    TableReference* current_table = nullptr;
    std::optional<Identifier> pending_alias{};
    Identifier pending_column{};
    QualifiedName pending_table{};
    Expression* pending_where = nullptr;

    CreateTableStatement create{};
    InsertStatement insert{};
    UpdateStatement update{};
    DropStatement drop{};

    std::optional<ParserDiagnostic> semantic_error{};
    std::size_t nesting_depth = 0U;
};

// Rules entered after an opening '(', a prefix operator or NOT. Each one is a
// level of recursion, and their depth is capped at max_nesting_depth.
template <typename Rule>
struct nesting_rule : std::false_type {};
template <>
struct nesting_rule<nested_expression> : std::true_type {};
template <>
struct nesting_rule<subquery_body> : std::true_type {};
template <>
struct nesting_rule<in_list_items> : std::true_type {};
template <>
struct nesting_rule<signed_operand> : std::true_type {};
template <>
struct nesting_rule<negated_operand> : std::true_type {};

template <typename Rule>
struct sql_control : pegtl::normal<Rule> {
    template <typename ParseInput>
    static void start(const ParseInput& in, ParseState& state)
    {
        if constexpr (nesting_rule<Rule>::value) {
            if (++state.nesting_depth > max_nesting_depth) {
                throw pegtl::parse_error("Expression nesting exceeds " + std::to_string(max_nesting_depth) + " levels",
                                         in);
            }
        }
    }

    template <typename ParseInput>
    static void success(const ParseInput&, ParseState& state) noexcept
    {
        if constexpr (nesting_rule<Rule>::value) {
            --state.nesting_depth;
        }
    }

    template <typename ParseInput>
    static void failure(const ParseInput&, ParseState& state) noexcept
    {
        if constexpr (nesting_rule<Rule>::value) {
            --state.nesting_depth;
        }
    }
};

std::string trim_copy(std::string_view text)
{
    const auto first = text.find_first_not_of(" \t\r\n");
    if (first == std::string_view::npos) {
        return {};
    }
    const auto last = text.find_last_not_of(" \t\r\n");
    return std::string{text.substr(first, last - first + 1)};
}

Identifier make_identifier(std::string_view text)
{
    Identifier identifier{};
    if (text.size() >= 2U && text.front() == '"' && text.back() == '"') {
        identifier.value.assign(text.substr(1U, text.size() - 2U));
    } else {
        identifier.value.assign(text);
    }
    return identifier;
}

QualifiedName make_qualified_name(std::string_view text)
{
    QualifiedName name{};
    std::string part{};
    bool quoted = false;
    for (const char ch : text) {
        if (ch == '"') {
            quoted = !quoted;
            continue;
        }
        if (ch == '.' && !quoted) {
            if (!part.empty()) {
                name.parts.push_back(Identifier{std::move(part)});
                part.clear();
            }
            continue;
        }
        if (quoted || !std::isspace(static_cast<unsigned char>(ch))) {
            part.push_back(ch);
        }
    }

    if (!part.empty()) {
        name.parts.push_back(Identifier{std::move(part)});
    }
    return name;
}

std::string unescape_string_literal(std::string_view text)
{
    std::string result{};
    if (text.size() >= 2U && text.front() == '\'' && text.back() == '\'') {
        for (std::size_t index = 1U; index + 1U < text.size(); ++index) {
            const char ch = text[index];
            if (ch == '\'' && index + 1U < text.size() - 1U && text[index + 1U] == '\'') {
                result.push_back('\'');
                ++index;
            } else {
                result.push_back(ch);
            }
        }
        return result;
    }

    result.assign(text.begin(), text.end());
    return result;
}

bool is_decimal_literal(std::string_view token)
{
    return token.find('.') != std::string_view::npos;
}

template <typename Input>
void record_semantic_error(const Input& in, ParseState& state, std::string message)
{
    if (state.semantic_error) {
        return;
    }
    const auto position = in.position();
    ParserDiagnostic diagnostic{};
    diagnostic.severity = ParserSeverity::Error;
    diagnostic.message = std::move(message);
    diagnostic.line = static_cast<std::size_t>(position.line);
    diagnostic.column = static_cast<std::size_t>(position.column);
    state.semantic_error = std::move(diagnostic);
}

void push_expression(ParseState& state, Expression& expression)
{
    state.expression_stack.push_back(&expression);
}

Expression* pop_expression(ParseState& state)
{
    if (state.expression_stack.empty()) {
        return nullptr;
    }
    auto* expression = state.expression_stack.back();
    state.expression_stack.pop_back();
    return expression;
}

std::vector<Expression*> pop_marked_list(ParseState& state)
{
    std::vector<Expression*> items{};
    if (state.list_marks.empty()) {
        return items;
    }
    const auto mark = std::min(state.list_marks.back(), state.expression_stack.size());
    state.list_marks.pop_back();
    items.assign(state.expression_stack.begin() + static_cast<std::ptrdiff_t>(mark), state.expression_stack.end());
    state.expression_stack.resize(mark);
    return items;
}

void push_binary(ParseState& state, BinaryOperator op)
{
    auto* right = pop_expression(state);
    auto* left = pop_expression(state);
    auto& expression = state.arena->make<BinaryExpression>();
    expression.op = op;
    expression.left = left;
    expression.right = right;
    push_expression(state, expression);
}

void push_unary(ParseState& state, UnaryOperator op)
{
    auto& expression = state.arena->make<UnaryExpression>();
    expression.op = op;
    expression.operand = pop_expression(state);
    push_expression(state, expression);
}

QuerySpecification* current_query(ParseState& state) noexcept
{
    return state.query_frames.empty() ? nullptr : state.query_frames.back();
}

QuerySpecification* pop_query(ParseState& state) noexcept
{
    if (state.query_frames.empty()) {
        return nullptr;
    }
    auto* query = state.query_frames.back();
    state.query_frames.pop_back();
    return query;
}

QuerySpecification* take_completed_query(ParseState& state) noexcept
{
    return std::exchange(state.completed_query, nullptr);
}

void add_select_item(ParseState& state, Expression* expression, std::optional<Identifier> alias)
{
    auto* query = current_query(state);
    if (query == nullptr) {
        return;
    }
    auto& item = state.arena->make<SelectItem>();
    item.expression = expression;
    item.alias = std::move(alias);
    query->select_items.push_back(&item);
}

std::optional<data::Value> parse_default_number(std::string_view text)
{
    if (is_decimal_literal(text)) {
        const std::string buffer{text};
        char* end = nullptr;
        const auto value = std::strtod(buffer.c_str(), &end);
        if (end != buffer.c_str() + buffer.size()) {
            return std::nullopt;
        }
        return data::Value{value};
    }

    if (!text.empty() && text.front() == '+') {
        text.remove_prefix(1U);
    }
    std::int64_t value = 0;
    const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size()) {
        return std::nullopt;
    }
    return data::Value{value};
}

data::ColumnDefinition* current_column(ParseState& state) noexcept
{
    return state.create.columns.empty() ? nullptr : &state.create.columns.back();
}

template <typename Rule>
struct sql_action : pegtl::nothing<Rule> {};

template <>
struct sql_action<numeric_literal_rule> {
    template <typename Input>
    static void apply(const Input& in, ParseState& state)
    {
        auto& expression = state.arena->make<LiteralExpression>();
        auto token = in.string();
        expression.tag = is_decimal_literal(token) ? LiteralTag::Decimal : LiteralTag::Integer;
        expression.text = std::move(token);
        push_expression(state, expression);
    }
};

template <>
struct sql_action<string_literal_rule> {
    template <typename Input>
    static void apply(const Input& in, ParseState& state)
    {
        auto& expression = state.arena->make<LiteralExpression>();
        expression.tag = LiteralTag::String;
        expression.text = unescape_string_literal(in.string_view());
        push_expression(state, expression);
    }
};

template <bool Value>
struct boolean_literal_action {
    template <typename Input>
    static void apply(const Input&, ParseState& state)
    {
        auto& expression = state.arena->make<LiteralExpression>();
        expression.tag = LiteralTag::Boolean;
        expression.boolean_value = Value;
        expression.text = Value ? "TRUE" : "FALSE";
        push_expression(state, expression);
    }
};

template <>
struct sql_action<true_literal> : boolean_literal_action<true> {};

template <>
struct sql_action<false_literal> : boolean_literal_action<false> {};

template <>
struct sql_action<null_literal> {
    template <typename Input>
    static void apply(const Input&, ParseState& state)
    {
        auto& expression = state.arena->make<LiteralExpression>();
        expression.tag = LiteralTag::Null;
        push_expression(state, expression);
    }
};

template <>
struct sql_action<column_reference> {
    template <typename Input>
    static void apply(const Input& in, ParseState& state)
    {
        auto& expression = state.arena->make<IdentifierExpression>();
        expression.name = make_qualified_name(in.string_view());
        push_expression(state, expression);
    }
};

template <>
struct sql_action<query_open> {
    template <typename Input>
    static void apply(const Input&, ParseState& state)
    {
        state.query_frames.push_back(&state.arena->make<QuerySpecification>());
    }
};

template <>
struct sql_action<subquery_rule> {
    template <typename Input>
    static void apply(const Input&, ParseState& state)
    {
        state.completed_query = pop_query(state);
    }
};

template <>
struct sql_action<scalar_subquery> {
    template <typename Input>
    static void apply(const Input&, ParseState& state)
    {
        auto& expression = state.arena->make<SubqueryExpression>();
        expression.query = take_completed_query(state);
        push_expression(state, expression);
    }
};

template <>
struct sql_action<exists_expression> {
    template <typename Input>
    static void apply(const Input&, ParseState& state)
    {
        auto& expression = state.arena->make<ExistsExpression>();
        expression.query = take_completed_query(state);
        push_expression(state, expression);
    }
};

template <>
struct sql_action<unary_minus> {
    template <typename Input>
    static void apply(const Input&, ParseState& state)
    {
        push_unary(state, UnaryOperator::Minus);
    }
};

template <>
struct sql_action<unary_plus> {
    template <typename Input>
    static void apply(const Input&, ParseState& state)
    {
        push_unary(state, UnaryOperator::Plus);
    }
};

template <>
struct sql_action<negation> {
    template <typename Input>
    static void apply(const Input&, ParseState& state)
    {
        push_unary(state, UnaryOperator::Not);
    }
};

template <BinaryOperator Op>
struct binary_action {
    template <typename Input>
    static void apply(const Input&, ParseState& state)
    {
        push_binary(state, Op);
    }
};

template <>
struct sql_action<multiply_tail> : binary_action<BinaryOperator::Multiply> {};

template <>
struct sql_action<divide_tail> : binary_action<BinaryOperator::Divide> {};

template <>
struct sql_action<add_tail> : binary_action<BinaryOperator::Add> {};

template <>
struct sql_action<subtract_tail> : binary_action<BinaryOperator::Subtract> {};

template <>
struct sql_action<and_tail> : binary_action<BinaryOperator::And> {};

template <>
struct sql_action<or_tail> : binary_action<BinaryOperator::Or> {};

template <>
struct sql_action<comparison_operator> {
    template <typename Input>
    static void apply(const Input& in, ParseState& state)
    {
        const auto text = in.string_view();
        auto op = BinaryOperator::Equal;
        if (text == "<=") {
            op = BinaryOperator::LessOrEqual;
        } else if (text == ">=") {
            op = BinaryOperator::GreaterOrEqual;
        } else if (text == "<>" || text == "!=") {
            op = BinaryOperator::NotEqual;
        } else if (text == "<") {
            op = BinaryOperator::Less;
        } else if (text == ">") {
            op = BinaryOperator::Greater;
        }
        state.operator_stack.push_back(op);
    }
};

template <>
struct sql_action<comparison_tail> {
    template <typename Input>
    static void apply(const Input&, ParseState& state)
    {
        auto op = BinaryOperator::Equal;
        if (!state.operator_stack.empty()) {
            op = state.operator_stack.back();
            state.operator_stack.pop_back();
        }
        push_binary(state, op);
    }
};

template <bool Negated>
struct is_null_action {
    template <typename Input>
    static void apply(const Input&, ParseState& state)
    {
        auto& expression = state.arena->make<IsNullExpression>();
        expression.operand = pop_expression(state);
        expression.negated = Negated;
        push_expression(state, expression);
    }
};

template <>
struct sql_action<is_null_tail> : is_null_action<false> {};

template <>
struct sql_action<is_not_null_tail> : is_null_action<true> {};

template <bool Negated>
struct between_action {
    template <typename Input>
    static void apply(const Input&, ParseState& state)
    {
        auto& expression = state.arena->make<BetweenExpression>();
        expression.high = pop_expression(state);
        expression.low = pop_expression(state);
        expression.operand = pop_expression(state);
        expression.negated = Negated;
        push_expression(state, expression);
    }
};

template <>
struct sql_action<between_tail> : between_action<false> {};

template <>
struct sql_action<not_between_tail> : between_action<true> {};

template <>
struct sql_action<list_open> {
    template <typename Input>
    static void apply(const Input&, ParseState& state)
    {
        state.list_marks.push_back(state.expression_stack.size());
    }
};

template <bool Negated>
struct in_list_action {
    template <typename Input>
    static void apply(const Input&, ParseState& state)
    {
        auto& expression = state.arena->make<InListExpression>();
        expression.items = pop_marked_list(state);
        expression.operand = pop_expression(state);
        expression.negated = Negated;
        push_expression(state, expression);
    }
};

template <>
struct sql_action<in_list_tail> : in_list_action<false> {};

template <>
struct sql_action<not_in_list_tail> : in_list_action<true> {};

template <bool Negated>
struct in_subquery_action {
    template <typename Input>
    static void apply(const Input&, ParseState& state)
    {
        auto& expression = state.arena->make<InSubqueryExpression>();
        expression.operand = pop_expression(state);
        expression.query = take_completed_query(state);
        expression.negated = Negated;
        push_expression(state, expression);
    }
};

template <>
struct sql_action<in_subquery_tail> : in_subquery_action<false> {};

template <>
struct sql_action<not_in_subquery_tail> : in_subquery_action<true> {};

template <>
struct sql_action<qualified_star_item> {
    template <typename Input>
    static void apply(const Input& in, ParseState& state)
    {
        const auto text = in.string_view();
        auto& expression = state.arena->make<StarExpression>();
        expression.qualifier = make_qualified_name(text.substr(0U, text.rfind('.')));
        add_select_item(state, &expression, std::nullopt);
    }
};

template <>
struct sql_action<star_item> {
    template <typename Input>
    static void apply(const Input&, ParseState& state)
    {
        add_select_item(state, &state.arena->make<StarExpression>(), std::nullopt);
    }
};

template <>
struct sql_action<alias_identifier> {
    template <typename Input>
    static void apply(const Input& in, ParseState& state)
    {
        state.pending_alias = make_identifier(in.string_view());
    }
};

template <>
struct sql_action<expression_item> {
    template <typename Input>
    static void apply(const Input&, ParseState& state)
    {
        auto* expression = pop_expression(state);
        add_select_item(state, expression, std::exchange(state.pending_alias, std::nullopt));
    }
};

template <>
struct sql_action<left_join_keywords> {
    template <typename Input>
    static void apply(const Input&, ParseState& state)
    {
        if (auto* query = current_query(state)) {
            query->joins.push_back(JoinClause{JoinType::LeftOuter, nullptr, nullptr});
        }
    }
};

template <>
struct sql_action<inner_join_keywords> {
    template <typename Input>
    static void apply(const Input&, ParseState& state)
    {
        if (auto* query = current_query(state)) {
            query->joins.push_back(JoinClause{JoinType::Inner, nullptr, nullptr});
        }
    }
};

template <>
struct sql_action<table_name> {
    template <typename Input>
    static void apply(const Input& in, ParseState& state)
    {
        auto* query = current_query(state);
        if (query == nullptr) {
            return;
        }
        auto& table = state.arena->make<TableReference>();
        table.name = make_qualified_name(in.string_view());
        if (!query->joins.empty() && query->joins.back().table == nullptr) {
            query->joins.back().table = &table;
        } else {
            query->from = &table;
        }
        state.current_table = &table;
    }
};

template <>
struct sql_action<table_alias> {
    template <typename Input>
    static void apply(const Input& in, ParseState& state)
    {
        if (state.current_table != nullptr) {
            state.current_table->alias = make_identifier(in.string_view());
        }
    }
};

template <>
struct sql_action<join_on> {
    template <typename Input>
    static void apply(const Input&, ParseState& state)
    {
        auto* predicate = pop_expression(state);
        if (auto* query = current_query(state); query != nullptr && !query->joins.empty()) {
            query->joins.back().predicate = predicate;
        }
    }
};

template <>
struct sql_action<where_clause> {
    template <typename Input>
    static void apply(const Input&, ParseState& state)
    {
        auto* predicate = pop_expression(state);
        if (auto* query = current_query(state)) {
            query->where = predicate;
        }
    }
};

template <>
struct sql_action<limit_clause> {
    template <typename Input>
    static void apply(const Input&, ParseState& state)
    {
        auto* limit = pop_expression(state);
        if (auto* query = current_query(state)) {
            query->limit = limit;
        }
    }
};

template <>
struct sql_action<offset_clause> {
    template <typename Input>
    static void apply(const Input&, ParseState& state)
    {
        auto* offset = pop_expression(state);
        if (auto* query = current_query(state)) {
            query->offset = offset;
        }
    }
};

template <>
struct sql_action<select_statement> {
    template <typename Input>
    static void apply(const Input&, ParseState& state)
    {
        state.statements->emplace_back(SelectStatement{pop_query(state)});
    }
};

template <>
struct sql_action<if_not_exists> {
    template <typename Input>
    static void apply(const Input&, ParseState& state)
    {
        state.create.if_not_exists = true;
    }
};

template <>
struct sql_action<create_table_name> {
    template <typename Input>
    static void apply(const Input& in, ParseState& state)
    {
        state.create.name = make_qualified_name(in.string_view());
    }
};

template <>
struct sql_action<column_name> {
    template <typename Input>
    static void apply(const Input& in, ParseState& state)
    {
        data::ColumnDefinition column{};
        column.name = make_identifier(in.string_view()).value;
        state.create.columns.push_back(std::move(column));
    }
};

template <>
struct sql_action<type_word> {
    template <typename Input>
    static void apply(const Input& in, ParseState& state)
    {
        auto* column = current_column(state);
        if (column == nullptr) {
            return;
        }
        const auto type = data::parse_data_type(in.string_view());
        if (!type) {
            record_semantic_error(in, state, "Unknown data type '" + in.string() + "'");
            return;
        }
        column->data_type = *type;
    }
};

template <>
struct sql_action<not_null_option> {
    template <typename Input>
    static void apply(const Input&, ParseState& state)
    {
        if (auto* column = current_column(state)) {
            column->nullable = false;
        }
    }
};

template <>
struct sql_action<null_option> {
    template <typename Input>
    static void apply(const Input&, ParseState& state)
    {
        if (auto* column = current_column(state)) {
            column->nullable = true;
        }
    }
};

template <>
struct sql_action<default_numeric> {
    template <typename Input>
    static void apply(const Input& in, ParseState& state)
    {
        auto* column = current_column(state);
        if (column == nullptr) {
            return;
        }
        auto value = parse_default_number(in.string_view());
        if (!value) {
            record_semantic_error(in, state, "Numeric literal '" + in.string() + "' is out of range");
            return;
        }
        column->default_value = std::move(*value);
    }
};

template <>
struct sql_action<default_string> {
    template <typename Input>
    static void apply(const Input& in, ParseState& state)
    {
        if (auto* column = current_column(state)) {
            column->default_value = data::Value{unescape_string_literal(in.string_view())};
        }
    }
};

template <>
struct sql_action<default_true> {
    template <typename Input>
    static void apply(const Input&, ParseState& state)
    {
        if (auto* column = current_column(state)) {
            column->default_value = data::Value{true};
        }
    }
};

template <>
struct sql_action<default_false> {
    template <typename Input>
    static void apply(const Input&, ParseState& state)
    {
        if (auto* column = current_column(state)) {
            column->default_value = data::Value{false};
        }
    }
};

template <>
struct sql_action<default_null> {
    template <typename Input>
    static void apply(const Input&, ParseState& state)
    {
        if (auto* column = current_column(state)) {
            column->default_value = data::Value{};
        }
    }
};

template <>
struct sql_action<create_table_statement> {
    template <typename Input>
    static void apply(const Input& in, ParseState& state)
    {
        std::unordered_set<std::string> seen{};
        for (const auto& column : state.create.columns) {
            if (!seen.insert(column.name).second) {
                record_semantic_error(in, state, "Duplicate column name '" + column.name + "'");
            }
        }
        state.statements->emplace_back(std::exchange(state.create, CreateTableStatement{}));
    }
};

template <>
struct sql_action<insert_table_name> {
    template <typename Input>
    static void apply(const Input& in, ParseState& state)
    {
        state.insert.table_name = make_qualified_name(in.string_view());
    }
};

template <>
struct sql_action<insert_column> {
    template <typename Input>
    static void apply(const Input& in, ParseState& state)
    {
        state.insert.columns.push_back(make_identifier(in.string_view()));
    }
};

template <>
struct sql_action<values_open> {
    template <typename Input>
    static void apply(const Input&, ParseState& state)
    {
        state.list_marks.push_back(state.expression_stack.size());
    }
};

template <>
struct sql_action<values_row> {
    template <typename Input>
    static void apply(const Input&, ParseState& state)
    {
        state.insert.rows.push_back(InsertRow{pop_marked_list(state)});
    }
};

template <>
struct sql_action<insert_statement> {
    template <typename Input>
    static void apply(const Input&, ParseState& state)
    {
        state.statements->emplace_back(std::exchange(state.insert, InsertStatement{}));
    }
};

template <>
struct sql_action<dml_where_clause> {
    template <typename Input>
    static void apply(const Input&, ParseState& state)
    {
        state.pending_where = pop_expression(state);
    }
};

template <>
struct sql_action<update_table_name> {
    template <typename Input>
    static void apply(const Input& in, ParseState& state)
    {
        state.update.table_name = make_qualified_name(in.string_view());
    }
};

template <>
struct sql_action<assignment_column> {
    template <typename Input>
    static void apply(const Input& in, ParseState& state)
    {
        state.pending_column = make_identifier(in.string_view());
    }
};

template <>
struct sql_action<assignment> {
    template <typename Input>
    static void apply(const Input&, ParseState& state)
    {
        UpdateAssignment entry{};
        entry.column = std::move(state.pending_column);
        entry.value = pop_expression(state);
        state.update.assignments.push_back(std::move(entry));
        state.pending_column = {};
    }
};

template <>
struct sql_action<update_statement> {
    template <typename Input>
    static void apply(const Input&, ParseState& state)
    {
        state.update.where = std::exchange(state.pending_where, nullptr);
        state.statements->emplace_back(std::exchange(state.update, UpdateStatement{}));
    }
};

template <>
struct sql_action<delete_table_name> {
    template <typename Input>
    static void apply(const Input& in, ParseState& state)
    {
        state.pending_table = make_qualified_name(in.string_view());
    }
};

template <>
struct sql_action<delete_statement> {
    template <typename Input>
    static void apply(const Input&, ParseState& state)
    {
        DeleteStatement statement{};
        statement.table_name = std::exchange(state.pending_table, QualifiedName{});
        statement.where = std::exchange(state.pending_where, nullptr);
        state.statements->emplace_back(std::move(statement));
    }
};

template <ObjectType Type>
struct drop_kind_action {
    template <typename Input>
    static void apply(const Input&, ParseState& state)
    {
        state.drop.object_type = Type;
    }
};

template <>
struct sql_action<drop_table_kind> : drop_kind_action<ObjectType::Table> {};

template <>
struct sql_action<drop_view_kind> : drop_kind_action<ObjectType::View> {};

template <>
struct sql_action<drop_index_kind> : drop_kind_action<ObjectType::Index> {};

template <>
struct sql_action<drop_schema_kind> : drop_kind_action<ObjectType::Schema> {};

template <>
struct sql_action<if_exists> {
    template <typename Input>
    static void apply(const Input&, ParseState& state)
    {
        state.drop.if_exists = true;
    }
};

template <>
struct sql_action<drop_name> {
    template <typename Input>
    static void apply(const Input& in, ParseState& state)
    {
        state.drop.names.push_back(make_qualified_name(in.string_view()));
    }
};

template <>
struct sql_action<drop_statement> {
    template <typename Input>
    static void apply(const Input&, ParseState& state)
    {
        state.statements->emplace_back(std::exchange(state.drop, DropStatement{}));
    }
};

template <TransactionVerb Verb>
struct transaction_action {
    template <typename Input>
    static void apply(const Input&, ParseState& state)
    {
        state.statements->emplace_back(TransactionStatement{Verb});
    }
};

template <>
struct sql_action<begin_statement> : transaction_action<TransactionVerb::Begin> {};

template <>
struct sql_action<commit_statement> : transaction_action<TransactionVerb::Commit> {};

template <>
struct sql_action<rollback_statement> : transaction_action<TransactionVerb::Rollback> {};

std::string format_parse_message(std::string_view message)
{
    constexpr std::string_view matching_prefix = "parse error matching ";
    if (message.rfind(matching_prefix, 0) == 0U && message.size() > matching_prefix.size()) {
        auto rule = message.substr(matching_prefix.size());
        if (const auto separator = rule.rfind("::"); separator != std::string_view::npos) {
            rule = rule.substr(separator + 2U);
        }
        if (rule == "eof") {
            return "Unexpected trailing input";
        }
        return "Missing " + std::string{rule};
    }
    return std::string{message};
}

std::string_view extract_token(std::string_view input, std::size_t offset)
{
    if (input.empty()) {
        return {};
    }

    offset = std::min(offset, input.size() - 1U);

    auto is_separator = [](char ch) {
        const auto unsigned_ch = static_cast<unsigned char>(ch);
        return std::isspace(unsigned_ch) != 0 || ch == ';' || ch == ',' || ch == '(' || ch == ')';
    };

    std::size_t end = offset;
    while (end < input.size() && !is_separator(input[end])) {
        ++end;
    }
    if (end == offset) {
        return input.substr(offset, 1U);
    }
    return input.substr(offset, end - offset);
}

ParserDiagnostic make_parse_error(const pegtl::parse_error& error, std::string_view source)
{
    ParserDiagnostic diagnostic{};
    diagnostic.severity = ParserSeverity::Error;
    diagnostic.message = format_parse_message(error.message());
    diagnostic.statement = trim_copy(source);
    diagnostic.remediation_hints = {"Review the SQL syntax near the reported token."};

    if (!error.positions().empty()) {
        const auto& position = error.positions().front();
        diagnostic.line = static_cast<std::size_t>(position.line);
        diagnostic.column = static_cast<std::size_t>(position.column);

        const auto byte_index = static_cast<std::size_t>(position.byte);
        if (byte_index < source.size()) {
            const auto token = trim_copy(extract_token(source, byte_index));
            if (!token.empty()) {
                diagnostic.message += " near '" + token + "'";
            }
        } else {
            diagnostic.message += " at end of input";
        }
    }

    return diagnostic;
}

}  // namespace

StatementParseResult parse_script(std::string_view input)
{
    StatementParseResult result{};
    ParseState state{};
    state.arena = &result.arena;
    state.statements = &result.statements;

    pegtl::memory_input in(input.data(), input.size(), "sql");
    try {
        const auto parsed = pegtl::parse<script_grammar, sql_action, sql_control>(in, state);
        if (!parsed) {
            ParserDiagnostic diagnostic{};
            diagnostic.message = "input did not match SQL grammar";
            diagnostic.line = 1U;
            diagnostic.column = 1U;
            diagnostic.statement = trim_copy(input);
            result.diagnostics.push_back(std::move(diagnostic));
        }
    } catch (const pegtl::parse_error& error) {
        result.diagnostics.push_back(make_parse_error(error, input));
    }

    if (result.diagnostics.empty() && state.semantic_error) {
        auto diagnostic = std::move(*state.semantic_error);
        diagnostic.statement = trim_copy(input);
        result.diagnostics.push_back(std::move(diagnostic));
    }

    if (!result.diagnostics.empty()) {
        result.statements.clear();
        result.arena.reset();
    }
    return result;
}

StatementParseResult parse_statement(std::string_view input)
{
    auto result = parse_script(input);
    if (result.success() && result.statements.size() != 1U) {
        ParserDiagnostic diagnostic{};
        diagnostic.message = result.statements.empty() ? "Missing statement" : "Expected exactly one statement";
        diagnostic.line = 1U;
        diagnostic.column = 1U;
        diagnostic.statement = trim_copy(input);
        diagnostic.remediation_hints = {"Submit statements one at a time or use a script."};
        result.diagnostics.push_back(std::move(diagnostic));
        result.statements.clear();
        result.arena.reset();
    }
    return result;
}

}  // namespace cairn::parser
