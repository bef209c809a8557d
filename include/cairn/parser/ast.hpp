#pragma once

#include "cairn/data/schema.hpp"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace cairn::parser {

class AstArena {
public:
    AstArena() = default;
    AstArena(const AstArena&) = delete;
    AstArena& operator=(const AstArena&) = delete;
    AstArena(AstArena&&) noexcept = default;
    AstArena& operator=(AstArena&&) noexcept = default;
    ~AstArena() noexcept;

    template <typename T, typename... Args>
    T& make(Args&&... args)
    {
        void* storage = allocate(sizeof(T), alignof(T));
        auto* object = std::construct_at(static_cast<T*>(storage), std::forward<Args>(args)...);
        register_destructor(object);
        return *object;
    }

    void reset() noexcept;

private:
    struct Chunk final {
        std::unique_ptr<std::byte[]> data{};
        std::size_t capacity = 0U;
        std::size_t used = 0U;
    };

    struct Destructor final {
        void (*destroy)(void*) noexcept = nullptr;
        void* pointer = nullptr;
    };

    static constexpr std::size_t kDefaultChunkSize = 4096U;

    static std::size_t align_up(std::size_t value, std::size_t alignment) noexcept;
    void* allocate(std::size_t size, std::size_t alignment);
    void add_chunk(std::size_t minimum_capacity);

    template <typename T>
    void register_destructor(T* pointer)
    {
        Destructor entry{};
        entry.pointer = pointer;
        entry.destroy = [](void* storage) noexcept {
            std::destroy_at(static_cast<T*>(storage));
        };
        destructors_.push_back(entry);
    }

    std::vector<Chunk> chunks_{};
    std::vector<Destructor> destructors_{};
};

struct Identifier final {
    std::string value{};

    bool operator==(const Identifier& other) const = default;
};

struct QualifiedName final {
    std::vector<Identifier> parts{};

    [[nodiscard]] bool empty() const noexcept { return parts.empty(); }

    bool operator==(const QualifiedName& other) const = default;
};

enum class NodeKind : std::uint8_t {
    QuerySpecification = 0,
    SelectItem,
    TableReference,
    IdentifierExpression,
    LiteralExpression,
    UnaryExpression,
    BinaryExpression,
    StarExpression,
    IsNullExpression,
    BetweenExpression,
    InListExpression,
    InSubqueryExpression,
    ExistsExpression,
    SubqueryExpression
};

enum class LiteralTag : std::uint8_t {
    Null = 0,
    Boolean,
    Integer,
    Decimal,
    String
};

enum class UnaryOperator : std::uint8_t {
    Not = 0,
    Minus,
    Plus
};

enum class BinaryOperator : std::uint8_t {
    Equal = 0,
    NotEqual,
    Less,
    LessOrEqual,
    Greater,
    GreaterOrEqual,
    Add,
    Subtract,
    Multiply,
    Divide,
    And,
    Or
};

enum class JoinType : std::uint8_t {
    Inner = 0,
    LeftOuter
};

struct Node {
    explicit Node(NodeKind kind) noexcept : kind(kind) {}
    Node(const Node&) = delete;
    Node& operator=(const Node&) = delete;
    Node(Node&&) = delete;
    Node& operator=(Node&&) = delete;
    virtual ~Node() = default;

    NodeKind kind;
};

struct QuerySpecification;
struct IdentifierExpression;
struct LiteralExpression;
struct UnaryExpression;
struct BinaryExpression;
struct StarExpression;
struct IsNullExpression;
struct BetweenExpression;
struct InListExpression;
struct InSubqueryExpression;
struct ExistsExpression;
struct SubqueryExpression;

class ExpressionVisitor {
public:
    virtual ~ExpressionVisitor() = default;
    virtual void visit(const IdentifierExpression& expression) = 0;
    virtual void visit(const LiteralExpression& expression) = 0;
    virtual void visit(const UnaryExpression& expression) = 0;
    virtual void visit(const BinaryExpression& expression) = 0;
    virtual void visit(const StarExpression& expression) = 0;
    virtual void visit(const IsNullExpression& expression) = 0;
    virtual void visit(const BetweenExpression& expression) = 0;
    virtual void visit(const InListExpression& expression) = 0;
    virtual void visit(const InSubqueryExpression& expression) = 0;
    virtual void visit(const ExistsExpression& expression) = 0;
    virtual void visit(const SubqueryExpression& expression) = 0;
};

struct Expression : Node {
    explicit Expression(NodeKind kind) noexcept : Node(kind) {}
    ~Expression() override = default;

    void accept(ExpressionVisitor& visitor) const;
};

struct SelectItem : Node {
    SelectItem() noexcept : Node(NodeKind::SelectItem) {}

    Expression* expression = nullptr;
    std::optional<Identifier> alias{};
};

struct TableReference : Node {
    TableReference() noexcept : Node(NodeKind::TableReference) {}

    QualifiedName name{};
    std::optional<Identifier> alias{};
};

struct JoinClause final {
    JoinType type = JoinType::Inner;
    TableReference* table = nullptr;
    Expression* predicate = nullptr;
};

struct QuerySpecification : Node {
    QuerySpecification() noexcept : Node(NodeKind::QuerySpecification) {}

    std::vector<SelectItem*> select_items{};
    TableReference* from = nullptr;
    std::vector<JoinClause> joins{};
    Expression* where = nullptr;
    Expression* limit = nullptr;
    Expression* offset = nullptr;
};

struct IdentifierExpression : Expression {
    IdentifierExpression() noexcept : Expression(NodeKind::IdentifierExpression) {}

    QualifiedName name{};
};

struct LiteralExpression : Expression {
    LiteralExpression() noexcept : Expression(NodeKind::LiteralExpression) {}

    LiteralTag tag = LiteralTag::String;
    bool boolean_value = false;
    std::string text{};
};

struct UnaryExpression : Expression {
    UnaryExpression() noexcept : Expression(NodeKind::UnaryExpression) {}

    UnaryOperator op = UnaryOperator::Not;
    Expression* operand = nullptr;
};

struct BinaryExpression : Expression {
    BinaryExpression() noexcept : Expression(NodeKind::BinaryExpression) {}

    BinaryOperator op = BinaryOperator::Equal;
    Expression* left = nullptr;
    Expression* right = nullptr;
};

struct StarExpression : Expression {
    StarExpression() noexcept : Expression(NodeKind::StarExpression) {}

    QualifiedName qualifier{};
};

struct IsNullExpression : Expression {
    IsNullExpression() noexcept : Expression(NodeKind::IsNullExpression) {}

    Expression* operand = nullptr;
    bool negated = false;
};

struct BetweenExpression : Expression {
    BetweenExpression() noexcept : Expression(NodeKind::BetweenExpression) {}

    Expression* operand = nullptr;
    Expression* low = nullptr;
    Expression* high = nullptr;
    bool negated = false;
};

struct InListExpression : Expression {
    InListExpression() noexcept : Expression(NodeKind::InListExpression) {}

    Expression* operand = nullptr;
    std::vector<Expression*> items{};
    bool negated = false;
};

struct InSubqueryExpression : Expression {
    InSubqueryExpression() noexcept : Expression(NodeKind::InSubqueryExpression) {}

    Expression* operand = nullptr;
    QuerySpecification* query = nullptr;
    bool negated = false;
};

struct ExistsExpression : Expression {
    ExistsExpression() noexcept : Expression(NodeKind::ExistsExpression) {}

    QuerySpecification* query = nullptr;
};

struct SubqueryExpression : Expression {
    SubqueryExpression() noexcept : Expression(NodeKind::SubqueryExpression) {}

    QuerySpecification* query = nullptr;
};

struct CreateTableStatement final {
    QualifiedName name{};
    std::vector<data::ColumnDefinition> columns{};
    bool if_not_exists = false;
};

struct SelectStatement final {
    QuerySpecification* query = nullptr;
};

struct InsertRow final {
    std::vector<Expression*> values{};
};

struct InsertStatement final {
    QualifiedName table_name{};
    std::vector<Identifier> columns{};
    std::vector<InsertRow> rows{};
};

struct UpdateAssignment final {
    Identifier column{};
    Expression* value = nullptr;
};

struct UpdateStatement final {
    QualifiedName table_name{};
    std::vector<UpdateAssignment> assignments{};
    Expression* where = nullptr;
};

struct DeleteStatement final {
    QualifiedName table_name{};
    Expression* where = nullptr;
};

enum class ObjectType : std::uint8_t {
    Table = 0,
    View,
    Index,
    Schema
};

struct DropStatement final {
    ObjectType object_type = ObjectType::Table;
    std::vector<QualifiedName> names{};
    bool if_exists = false;
};

enum class TransactionVerb : std::uint8_t {
    Begin = 0,
    Commit,
    Rollback
};

struct TransactionStatement final {
    TransactionVerb verb = TransactionVerb::Begin;
};

using Statement = std::variant<CreateTableStatement,
                               SelectStatement,
                               InsertStatement,
                               UpdateStatement,
                               DeleteStatement,
                               DropStatement,
                               TransactionStatement>;

[[nodiscard]] std::string format_qualified_name(const QualifiedName& name);
[[nodiscard]] std::string describe(const Expression& expression);
[[nodiscard]] std::string_view statement_kind_name(const Statement& statement) noexcept;

}  // namespace cairn::parser

namespace cairn::parser {

inline AstArena::~AstArena() noexcept
{
    reset();
}

inline std::size_t AstArena::align_up(std::size_t value, std::size_t alignment) noexcept
{
    const auto mask = alignment - 1U;
    return (value + mask) & ~mask;
}

inline void AstArena::reset() noexcept
{
    for (auto it = destructors_.rbegin(); it != destructors_.rend(); ++it) {
        if (it->destroy && it->pointer) {
            it->destroy(it->pointer);
        }
    }
    destructors_.clear();
    for (auto& chunk : chunks_) {
        chunk.used = 0U;
    }
}

inline void* AstArena::allocate(std::size_t size, std::size_t alignment)
{
    if (alignment == 0U) {
        alignment = alignof(std::max_align_t);
    }

    const auto adjusted_size = align_up(size, alignment);

    while (chunks_.empty() || chunks_.back().used + adjusted_size > chunks_.back().capacity) {
        add_chunk(std::max(kDefaultChunkSize, adjusted_size));
    }

    auto& chunk = chunks_.back();
    const auto offset = align_up(chunk.used, alignment);
    chunk.used = offset + adjusted_size;
    return chunk.data.get() + offset;
}

inline void AstArena::add_chunk(std::size_t minimum_capacity)
{
    Chunk chunk{};
    chunk.capacity = align_up(minimum_capacity, alignof(std::max_align_t));
    chunk.data = std::unique_ptr<std::byte[]>(new std::byte[chunk.capacity]);
    chunk.used = 0U;
    chunks_.push_back(std::move(chunk));
}

inline void Expression::accept(ExpressionVisitor& visitor) const
{
    switch (kind) {
    case NodeKind::IdentifierExpression:
        visitor.visit(static_cast<const IdentifierExpression&>(*this));
        break;
    case NodeKind::LiteralExpression:
        visitor.visit(static_cast<const LiteralExpression&>(*this));
        break;
    case NodeKind::UnaryExpression:
        visitor.visit(static_cast<const UnaryExpression&>(*this));
        break;
    case NodeKind::BinaryExpression:
        visitor.visit(static_cast<const BinaryExpression&>(*this));
        break;
    case NodeKind::StarExpression:
        visitor.visit(static_cast<const StarExpression&>(*this));
        break;
    case NodeKind::IsNullExpression:
        visitor.visit(static_cast<const IsNullExpression&>(*this));
        break;
    case NodeKind::BetweenExpression:
        visitor.visit(static_cast<const BetweenExpression&>(*this));
        break;
    case NodeKind::InListExpression:
        visitor.visit(static_cast<const InListExpression&>(*this));
        break;
    case NodeKind::InSubqueryExpression:
        visitor.visit(static_cast<const InSubqueryExpression&>(*this));
        break;
    case NodeKind::ExistsExpression:
        visitor.visit(static_cast<const ExistsExpression&>(*this));
        break;
    case NodeKind::SubqueryExpression:
        visitor.visit(static_cast<const SubqueryExpression&>(*this));
        break;
    default:
        break;
    }
}

}  // namespace cairn::parser
