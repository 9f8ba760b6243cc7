#include <invar/io/protobuf.hpp>
#include <invar/io/report_io.hpp>

namespace invar {

void dump_value(const Value& value, protobuf::Value& message) {
    message.Clear();
    switch (value.kind()) {
        case Value::Kind::NONE:
            message.set_kind(protobuf::Value::NONE);
            break;
        case Value::Kind::INT:
            message.set_kind(protobuf::Value::INT);
            message.set_int_value(value.as_int().str());
            break;
        case Value::Kind::BOOL:
            message.set_kind(protobuf::Value::BOOL);
            message.set_bool_value(value.as_bool());
            break;
        case Value::Kind::STRING:
            message.set_kind(protobuf::Value::STRING);
            message.set_string_value(value.as_string());
            break;
        case Value::Kind::RECORD: {
            message.set_kind(protobuf::Value::RECORD);
            const Type& type = *value.type();
            message.set_type(type.name());
            for (size_t i = 0; i < type.fields().size(); ++i) {
                auto& field = *message.add_fields();
                field.set_name(type.fields()[i].first);
                dump_value(value.fields()[i], *field.mutable_value());
            }
            break;
        }
        case Value::Kind::HANDLE:
            message.set_kind(protobuf::Value::HANDLE);
            message.set_type(value.type()->name());
            message.set_handle_id(value.handle_id());
            dump_value(value.handle_val(), *message.mutable_val());
            break;
        case Value::Kind::BAG:
            message.set_kind(protobuf::Value::BAG);
            for (const Value& item : value.as_bag()) {
                dump_value(item, *message.add_items());
            }
            break;
    }
}

static protobuf::Verdict::Kind dump_kind(VerdictKind kind) {
    switch (kind) {
        case VerdictKind::UNCHECKED:
            return protobuf::Verdict::UNCHECKED;
        case VerdictKind::PROVEN:
            return protobuf::Verdict::PROVEN;
        case VerdictKind::DISPROVEN:
            return protobuf::Verdict::DISPROVEN;
        case VerdictKind::INCONCLUSIVE:
            return protobuf::Verdict::INCONCLUSIVE;
    }
    INVAR_ERROR("unknown verdict kind");
}

void dump_report(const VerificationReport& report,
                 protobuf::VerificationReport& message) {
    message.Clear();
    for (const auto& verdict : report.verdicts()) {
        auto& out = *message.add_verdicts();
        out.set_operation(verdict.operation);
        out.set_invariant(verdict.invariant);
        out.set_kind(dump_kind(verdict.kind));
        out.set_reason(verdict.reason);
        for (const auto& obligation : verdict.obligations) {
            out.add_obligations(obligation);
        }
        if (verdict.kind == VerdictKind::DISPROVEN) {
            auto& counterexample = *out.mutable_counterexample();
            for (const auto& param : verdict.counterexample.params) {
                auto& binding = *counterexample.add_params();
                binding.set_name(param.first);
                dump_value(param.second, *binding.mutable_value());
            }
            for (const auto& pair : verdict.counterexample.state.bags()) {
                auto& binding = *counterexample.add_state();
                binding.set_name(pair.first);
                dump_value(Value::bag(pair.second), *binding.mutable_value());
            }
        }
    }
    message.set_deployable(report.deployable());
}

void write_report(const VerificationReport& report,
                  const std::string& filename) {
    INVAR_INFO("writing report to " << filename);
    protobuf::VerificationReport message;
    dump_report(report, message);
    protobuf::OutFile(filename).write(message);
}

void read_report(const std::string& filename,
                 protobuf::VerificationReport& message) {
    protobuf::InFile(filename).read(message);
}

}  // namespace invar
