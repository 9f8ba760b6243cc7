#pragma once

#include <invar/io/messages.pb.h>
#include <invar/verifier/verifier.hpp>
#include <string>

namespace invar {

void dump_value(const Value& value, protobuf::Value& message);
void dump_report(const VerificationReport& report,
                 protobuf::VerificationReport& message);

// Files are gzipped serialized messages.
void write_report(const VerificationReport& report,
                  const std::string& filename);
void read_report(const std::string& filename,
                 protobuf::VerificationReport& message);

}  // namespace invar
