#include "cairn/parser/ast.hpp"

#include <iterator>
#include <sstream>
#include <string_view>

namespace cairn::parser {
namespace {

std::string describe_query(const QuerySpecification& query);

class ExpressionPrinter final : public ExpressionVisitor {
public:
    void visit(const IdentifierExpression& expression) override
    {
        result_ = format_qualified_name(expression.name);
    }

    void visit(const LiteralExpression& expression) override
    {
        switch (expression.tag) {
        case LiteralTag::Null:
            result_ = "NULL";
            break;
        case LiteralTag::Boolean:
            result_ = expression.boolean_value ? "TRUE" : "FALSE";
            break;
        case LiteralTag::Integer:
        case LiteralTag::Decimal:
            result_ = expression.text;
            break;
        case LiteralTag::String:
        default:
            result_.clear();
            result_.push_back('\'');
            result_.append(expression.text);
            result_.push_back('\'');
            break;
        }
    }

    void visit(const UnaryExpression& expression) override
    {
        static constexpr std::string_view operators[] = {"NOT ", "-", "+"};

        std::ostringstream stream;
        const auto index = static_cast<std::size_t>(expression.op);
        stream << (index < std::size(operators) ? operators[index] : "? ");
        stream << operand(expression.operand);
        result_ = stream.str();
    }

    void visit(const BinaryExpression& expression) override
    {
        static constexpr std::string_view operators[] = {
            " = ",
            " <> ",
            " < ",
            " <= ",
            " > ",
            " >= ",
            " + ",
            " - ",
            " * ",
            " / ",
            " AND ",
            " OR "
        };

        std::ostringstream stream;
        stream << '(' << operand(expression.left);

        const auto index = static_cast<std::size_t>(expression.op);
        if (index < std::size(operators)) {
            stream << operators[index];
        } else {
            stream << " ? ";
        }

        stream << operand(expression.right) << ')';
        result_ = stream.str();
    }

    void visit(const StarExpression& expression) override
    {
        if (expression.qualifier.empty()) {
            result_ = "*";
        } else {
            result_ = format_qualified_name(expression.qualifier) + ".*";
        }
    }

    void visit(const IsNullExpression& expression) override
    {
        result_ = operand(expression.operand) + (expression.negated ? " IS NOT NULL" : " IS NULL");
    }

    void visit(const BetweenExpression& expression) override
    {
        std::ostringstream stream;
        stream << operand(expression.operand) << (expression.negated ? " NOT BETWEEN " : " BETWEEN ")
               << operand(expression.low) << " AND " << operand(expression.high);
        result_ = stream.str();
    }

    void visit(const InListExpression& expression) override
    {
        std::ostringstream stream;
        stream << operand(expression.operand) << (expression.negated ? " NOT IN (" : " IN (");
        for (std::size_t index = 0U; index < expression.items.size(); ++index) {
            if (index > 0U) {
                stream << ", ";
            }
            stream << operand(expression.items[index]);
        }
        stream << ')';
        result_ = stream.str();
    }

    void visit(const InSubqueryExpression& expression) override
    {
        result_ = operand(expression.operand) + (expression.negated ? " NOT IN " : " IN ") + subquery(expression.query);
    }

    void visit(const ExistsExpression& expression) override
    {
        result_ = "EXISTS " + subquery(expression.query);
    }

    void visit(const SubqueryExpression& expression) override
    {
        result_ = subquery(expression.query);
    }

    [[nodiscard]] std::string take() { return std::move(result_); }

private:
    static std::string operand(const Expression* expression)
    {
        return expression != nullptr ? describe(*expression) : std::string{"<null>"};
    }

    static std::string subquery(const QuerySpecification* query)
    {
        return query != nullptr ? "(" + describe_query(*query) + ")" : std::string{"(<null>)"};
    }

    std::string result_{};
};

std::string describe_table(const TableReference& table)
{
    auto text = format_qualified_name(table.name);
    if (table.alias) {
        text += " AS " + table.alias->value;
    }
    return text;
}

std::string describe_query(const QuerySpecification& query)
{
    std::ostringstream stream;
    stream << "SELECT ";
    for (std::size_t index = 0U; index < query.select_items.size(); ++index) {
        if (index > 0U) {
            stream << ", ";
        }
        const auto* item = query.select_items[index];
        if (item == nullptr || item->expression == nullptr) {
            stream << "<null>";
            continue;
        }
        stream << describe(*item->expression);
        if (item->alias) {
            stream << " AS " << item->alias->value;
        }
    }

    if (query.from != nullptr) {
        stream << " FROM " << describe_table(*query.from);
    }
    for (const auto& join : query.joins) {
        stream << (join.type == JoinType::LeftOuter ? " LEFT JOIN " : " JOIN ");
        if (join.table != nullptr) {
            stream << describe_table(*join.table);
        }
        if (join.predicate != nullptr) {
            stream << " ON " << describe(*join.predicate);
        }
    }
    if (query.where != nullptr) {
        stream << " WHERE " << describe(*query.where);
    }
    if (query.limit != nullptr) {
        stream << " LIMIT " << describe(*query.limit);
    }
    if (query.offset != nullptr) {
        stream << " OFFSET " << describe(*query.offset);
    }
    return stream.str();
}

}  // namespace

std::string format_qualified_name(const QualifiedName& name)
{
    std::string result;
    for (std::size_t index = 0U; index < name.parts.size(); ++index) {
        if (index > 0U) {
            result.push_back('.');
        }
        result.append(name.parts[index].value);
    }
    return result;
}

std::string describe(const Expression& expression)
{
    ExpressionPrinter printer;
    expression.accept(printer);
    return printer.take();
}

std::string_view statement_kind_name(const Statement& statement) noexcept
{
    switch (statement.index()) {
    case 0U:
        return "CREATE TABLE";
    case 1U:
        return "SELECT";
    case 2U:
        return "INSERT";
    case 3U:
        return "UPDATE";
    case 4U:
        return "DELETE";
    case 5U:
        return "DROP";
    case 6U:
        return "TRANSACTION";
    default:
        return "UNKNOWN";
    }
}

}  // namespace cairn::parser
