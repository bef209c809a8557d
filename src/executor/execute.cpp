#include "cairn/executor/execute.hpp"

namespace cairn::executor {
namespace {

struct PayloadDescriber final {
    std::string operator()(const CreatePayload&) const { return "CREATE TABLE"; }
    std::string operator()(const InsertPayload&) const { return "INSERT 1"; }
    std::string operator()(const SelectPayload& payload) const
    {
        return "SELECT " + std::to_string(payload.rows.size());
    }
    std::string operator()(const DeletePayload& payload) const { return "DELETE " + std::to_string(payload.count); }
    std::string operator()(const UpdatePayload& payload) const { return "UPDATE " + std::to_string(payload.count); }
    std::string operator()(const DropTablePayload&) const { return "DROP TABLE"; }
};

}  // namespace

std::string describe_payload(const Payload& payload)
{
    return std::visit(PayloadDescriber{}, payload);
}

}  // namespace cairn::executor
