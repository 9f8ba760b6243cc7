// Values and types.
//
// Design decisions:
// - Values are immutable; records and bags share their storage on copy.
// - Plain records compare structurally; handles compare by identity only.
// - Bags are multisets; iteration follows insertion order.
// - Integers are exact and unbounded.

#pragma once

#include <boost/multiprecision/cpp_int.hpp>
#include <invar/model/status.hpp>
#include <invar/util/util.hpp>
#include <map>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace invar {

typedef boost::multiprecision::cpp_int Int;

//----------------------------------------------------------------------------
// Types

enum class TypeKind { INT, BOOL, STRING, RECORD, HANDLE, BAG };
const char* type_kind_name(TypeKind kind);

class Type;
typedef std::shared_ptr<const Type> TypePtr;
typedef std::pair<std::string, TypePtr> Field;

class Type {
   public:
    static TypePtr int_type();
    static TypePtr bool_type();
    static TypePtr string_type();
    static TypePtr record(const std::string& name, std::vector<Field> fields);
    static TypePtr handle(const std::string& name, TypePtr val_type);
    static TypePtr bag(TypePtr element);

    TypeKind kind() const { return kind_; }
    const std::string& name() const { return name_; }
    bool is_scalar() const {
        return kind_ == TypeKind::INT or kind_ == TypeKind::BOOL or
               kind_ == TypeKind::STRING;
    }

    // RECORD only.
    const std::vector<Field>& fields() const { return fields_; }
    int field_index(const std::string& name) const;  // -1 if undeclared

    // HANDLE: the record type of .val; BAG: the element type.
    const TypePtr& val_type() const;
    const TypePtr& element() const;

    bool operator==(const Type& other) const;
    bool operator!=(const Type& other) const { return not operator==(other); }

   private:
    Type(TypeKind kind, const std::string& name) : kind_(kind), name_(name) {}

    TypeKind kind_;
    std::string name_;
    std::vector<Field> fields_;
    TypePtr inner_;
};

std::ostream& operator<<(std::ostream& os, const Type& type);

//----------------------------------------------------------------------------
// Values

class Bag;

class Value {
   public:
    enum class Kind { NONE, INT, BOOL, STRING, RECORD, HANDLE, BAG };

    Value() : kind_(Kind::NONE), bool_(false), id_(0) {}

    static Value from_int(const Int& i);
    static Value from_bool(bool b);
    static Value from_string(const std::string& s);
    // These throw TypeMismatch if the parts do not match the type.
    static Value record(TypePtr type, std::vector<Value> fields);
    static Value handle(TypePtr type, uint64_t id, const Value& val);
    static Value bag(const Bag& bag);

    Kind kind() const { return kind_; }
    bool is_none() const { return kind_ == Kind::NONE; }

    // Accessors throw TypeMismatch on the wrong kind.
    const Int& as_int() const;
    bool as_bool() const;
    const std::string& as_string() const;
    Bag as_bag() const;
    uint64_t handle_id() const;
    const Value& handle_val() const;
    const TypePtr& type() const;  // RECORD or HANDLE
    const std::vector<Value>& fields() const;

    // Handles expose "val", and forward other names to their val record.
    bool has_field(const std::string& name) const;
    const Value& field(const std::string& name) const;

    bool operator==(const Value& other) const;
    bool operator!=(const Value& other) const { return not operator==(other); }
    size_t hash() const;

    // Total order on same-kind values, for comparisons and sort keys.
    int compare(const Value& other) const;

   private:
    friend class Bag;

    Kind kind_;
    bool bool_;
    uint64_t id_;
    Int int_;
    std::string string_;
    TypePtr type_;
    std::shared_ptr<const std::vector<Value>> items_;
};

const char* value_kind_name(Value::Kind kind);
std::ostream& operator<<(std::ostream& os, const Value& value);

struct ValueHash {
    size_t operator()(const Value& value) const { return value.hash(); }
};

//----------------------------------------------------------------------------
// Bags

class Bag {
   public:
    typedef std::vector<Value>::const_iterator const_iterator;

    Bag();
    explicit Bag(std::vector<Value> items);

    size_t size() const { return items_->size(); }
    bool empty() const { return items_->empty(); }
    const_iterator begin() const { return items_->begin(); }
    const_iterator end() const { return items_->end(); }
    const std::vector<Value>& items() const { return *items_; }

    size_t count(const Value& value) const;
    bool contains(const Value& value) const;

    // Each returns a new bag; this bag is unchanged.
    Bag insert(const Value& value) const;
    Bag remove(const Value& value) const;  // one occurrence, if any
    Bag merge(const Bag& other) const;
    Bag subtract(const Bag& other) const;

    // Multiset equality, insensitive to order.
    bool operator==(const Bag& other) const;
    bool operator!=(const Bag& other) const { return not operator==(other); }
    size_t hash() const;

   private:
    friend class Value;
    explicit Bag(std::shared_ptr<const std::vector<Value>> items)
        : items_(std::move(items)) {}

    std::shared_ptr<const std::vector<Value>> items_;
};

std::ostream& operator<<(std::ostream& os, const Bag& bag);

//----------------------------------------------------------------------------
// Conformance

// Returns false and describes the first mismatch, without throwing.
bool conforms(const Value& value, const Type& type, std::string& error);
// Throws TypeMismatch.
void check_conforms(const Value& value, const Type& type);

//----------------------------------------------------------------------------
// Identity

// The one val carried by each handle identity (type name and id). Equality
// compares handles by identity, so every reachable state must agree on it.
class HandleIndex {
   public:
    // Indexes every handle inside value, including handles nested in vals.
    // Returns false and describes the first handle whose val differs from
    // the indexed one.
    bool add(const Value& value, std::string& error);
    bool add(const Bag& bag, std::string& error) {
        return add(Value::bag(bag), error);
    }

    // Returns false and describes the first identity indexed by both with
    // different vals.
    bool agrees(const HandleIndex& other, std::string& error) const;
    void merge(const HandleIndex& other);

    bool empty() const { return m_vals.empty(); }
    size_t size() const { return m_vals.size(); }
    uint64_t max_id() const;  // 0 if empty

   private:
    typedef std::pair<std::string, uint64_t> Identity;
    std::map<Identity, Value> m_vals;
};

}  // namespace invar
