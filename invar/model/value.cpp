#include <algorithm>
#include <boost/functional/hash.hpp>
#include <invar/model/value.hpp>
#include <unordered_map>

namespace invar {

//----------------------------------------------------------------------------
// Types

const char* type_kind_name(TypeKind kind) {
    switch (kind) {
        case TypeKind::INT:
            return "Int";
        case TypeKind::BOOL:
            return "Bool";
        case TypeKind::STRING:
            return "String";
        case TypeKind::RECORD:
            return "Record";
        case TypeKind::HANDLE:
            return "Handle";
        case TypeKind::BAG:
            return "Bag";
    }
    return "???";
}

TypePtr Type::int_type() {
    static const TypePtr type(new Type(TypeKind::INT, "Int"));
    return type;
}

TypePtr Type::bool_type() {
    static const TypePtr type(new Type(TypeKind::BOOL, "Bool"));
    return type;
}

TypePtr Type::string_type() {
    static const TypePtr type(new Type(TypeKind::STRING, "String"));
    return type;
}

// A null field type leaves that field unconstrained; the evaluator uses this
// for anonymous records built by queries.
TypePtr Type::record(const std::string& name, std::vector<Field> fields) {
    Type* type = new Type(TypeKind::RECORD, name);
    type->fields_ = std::move(fields);
    return TypePtr(type);
}

TypePtr Type::handle(const std::string& name, TypePtr val_type) {
    INVAR_ASSERT(val_type and val_type->kind() == TypeKind::RECORD,
                 "handle " << name << " must wrap a record type");
    Type* type = new Type(TypeKind::HANDLE, name);
    type->inner_ = std::move(val_type);
    return TypePtr(type);
}

TypePtr Type::bag(TypePtr element) {
    INVAR_ASSERT(element, "bag element type is null");
    Type* type = new Type(TypeKind::BAG, "Bag");
    type->inner_ = std::move(element);
    return TypePtr(type);
}

int Type::field_index(const std::string& name) const {
    for (size_t i = 0; i < fields_.size(); ++i) {
        if (fields_[i].first == name) {
            return i;
        }
    }
    return -1;
}

const TypePtr& Type::val_type() const {
    INVAR_ASSERT(kind_ == TypeKind::HANDLE, "not a handle type: " << *this);
    return inner_;
}

const TypePtr& Type::element() const {
    INVAR_ASSERT(kind_ == TypeKind::BAG, "not a bag type: " << *this);
    return inner_;
}

bool Type::operator==(const Type& other) const {
    if (this == &other) return true;
    if (kind_ != other.kind_) return false;
    switch (kind_) {
        case TypeKind::INT:
        case TypeKind::BOOL:
        case TypeKind::STRING:
            return true;
        case TypeKind::RECORD: {
            if (name_ != other.name_) return false;
            if (fields_.size() != other.fields_.size()) return false;
            for (size_t i = 0; i < fields_.size(); ++i) {
                const Field& x = fields_[i];
                const Field& y = other.fields_[i];
                if (x.first != y.first) return false;
                if (bool(x.second) != bool(y.second)) return false;
                if (x.second and *x.second != *y.second) return false;
            }
            return true;
        }
        case TypeKind::HANDLE:
            return name_ == other.name_ and *inner_ == *other.inner_;
        case TypeKind::BAG:
            return *inner_ == *other.inner_;
    }
    return false;
}

std::ostream& operator<<(std::ostream& os, const Type& type) {
    switch (type.kind()) {
        case TypeKind::BAG:
            return os << "Bag<" << *type.element() << ">";
        case TypeKind::RECORD:
            return os << (type.name().empty() ? "{...}" : type.name());
        default:
            return os << type.name();
    }
}

//----------------------------------------------------------------------------
// Values

const char* value_kind_name(Value::Kind kind) {
    switch (kind) {
        case Value::Kind::NONE:
            return "none";
        case Value::Kind::INT:
            return "Int";
        case Value::Kind::BOOL:
            return "Bool";
        case Value::Kind::STRING:
            return "String";
        case Value::Kind::RECORD:
            return "Record";
        case Value::Kind::HANDLE:
            return "Handle";
        case Value::Kind::BAG:
            return "Bag";
    }
    return "???";
}

Value Value::from_int(const Int& i) {
    Value result;
    result.kind_ = Kind::INT;
    result.int_ = i;
    return result;
}

Value Value::from_bool(bool b) {
    Value result;
    result.kind_ = Kind::BOOL;
    result.bool_ = b;
    return result;
}

Value Value::from_string(const std::string& s) {
    Value result;
    result.kind_ = Kind::STRING;
    result.string_ = s;
    return result;
}

Value Value::record(TypePtr type, std::vector<Value> fields) {
    if (not type or type->kind() != TypeKind::RECORD) {
        throw TypeMismatch("record value needs a record type");
    }
    const auto& declared = type->fields();
    if (fields.size() != declared.size()) {
        std::ostringstream message;
        message << "record " << *type << " declares " << declared.size()
                << " fields, got " << fields.size();
        throw TypeMismatch(message.str());
    }
    for (size_t i = 0; i < fields.size(); ++i) {
        std::string error;
        if (declared[i].second and
            not conforms(fields[i], *declared[i].second, error)) {
            throw TypeMismatch("field " + declared[i].first + ": " + error);
        }
    }
    Value result;
    result.kind_ = Kind::RECORD;
    result.type_ = std::move(type);
    result.items_ = std::make_shared<const std::vector<Value>>(
        std::move(fields));
    return result;
}

Value Value::handle(TypePtr type, uint64_t id, const Value& val) {
    if (not type or type->kind() != TypeKind::HANDLE) {
        throw TypeMismatch("handle value needs a handle type");
    }
    check_conforms(val, *type->val_type());
    Value result;
    result.kind_ = Kind::HANDLE;
    result.id_ = id;
    result.type_ = std::move(type);
    result.items_ = std::make_shared<const std::vector<Value>>(1, val);
    return result;
}

Value Value::bag(const Bag& bag) {
    Value result;
    result.kind_ = Kind::BAG;
    result.items_ = bag.items_;
    return result;
}

static void throw_wrong_kind(Value::Kind expected, Value::Kind actual) {
    std::ostringstream message;
    message << "expected " << value_kind_name(expected) << ", got "
            << value_kind_name(actual);
    throw TypeMismatch(message.str());
}

const Int& Value::as_int() const {
    if (kind_ != Kind::INT) throw_wrong_kind(Kind::INT, kind_);
    return int_;
}

bool Value::as_bool() const {
    if (kind_ != Kind::BOOL) throw_wrong_kind(Kind::BOOL, kind_);
    return bool_;
}

const std::string& Value::as_string() const {
    if (kind_ != Kind::STRING) throw_wrong_kind(Kind::STRING, kind_);
    return string_;
}

Bag Value::as_bag() const {
    if (kind_ != Kind::BAG) throw_wrong_kind(Kind::BAG, kind_);
    return Bag(items_);
}

uint64_t Value::handle_id() const {
    if (kind_ != Kind::HANDLE) throw_wrong_kind(Kind::HANDLE, kind_);
    return id_;
}

const Value& Value::handle_val() const {
    if (kind_ != Kind::HANDLE) throw_wrong_kind(Kind::HANDLE, kind_);
    return (*items_)[0];
}

const TypePtr& Value::type() const {
    if (kind_ != Kind::RECORD and kind_ != Kind::HANDLE) {
        throw_wrong_kind(Kind::RECORD, kind_);
    }
    return type_;
}

const std::vector<Value>& Value::fields() const {
    if (kind_ != Kind::RECORD) throw_wrong_kind(Kind::RECORD, kind_);
    return *items_;
}

bool Value::has_field(const std::string& name) const {
    switch (kind_) {
        case Kind::RECORD:
            return type_->field_index(name) >= 0;
        case Kind::HANDLE:
            return name == "val" or (*items_)[0].has_field(name);
        default:
            return false;
    }
}

const Value& Value::field(const std::string& name) const {
    switch (kind_) {
        case Kind::RECORD: {
            const int index = type_->field_index(name);
            if (index < 0) {
                std::ostringstream message;
                message << "type " << *type_ << " has no field " << name;
                throw TypeMismatch(message.str());
            }
            return (*items_)[index];
        }
        case Kind::HANDLE:
            return name == "val" ? (*items_)[0] : (*items_)[0].field(name);
        default: {
            std::ostringstream message;
            message << "cannot read field " << name << " of a "
                    << value_kind_name(kind_);
            throw TypeMismatch(message.str());
        }
    }
}

bool Value::operator==(const Value& other) const {
    if (kind_ != other.kind_) return false;
    switch (kind_) {
        case Kind::NONE:
            return true;
        case Kind::INT:
            return int_ == other.int_;
        case Kind::BOOL:
            return bool_ == other.bool_;
        case Kind::STRING:
            return string_ == other.string_;
        case Kind::RECORD:
            return type_->name() == other.type_->name() and
                   (items_ == other.items_ or *items_ == *other.items_);
        case Kind::HANDLE:
            return id_ == other.id_ and type_->name() == other.type_->name();
        case Kind::BAG:
            return Bag(items_) == Bag(other.items_);
    }
    return false;
}

size_t Value::hash() const {
    size_t result = static_cast<size_t>(kind_);
    switch (kind_) {
        case Kind::NONE:
            break;
        case Kind::INT:
            boost::hash_combine(result, int_.str());
            break;
        case Kind::BOOL:
            boost::hash_combine(result, bool_);
            break;
        case Kind::STRING:
            boost::hash_combine(result, string_);
            break;
        case Kind::RECORD:
            boost::hash_combine(result, type_->name());
            for (const auto& item : *items_) {
                boost::hash_combine(result, item.hash());
            }
            break;
        case Kind::HANDLE:
            boost::hash_combine(result, type_->name());
            boost::hash_combine(result, id_);
            break;
        case Kind::BAG:
            boost::hash_combine(result, Bag(items_).hash());
            break;
    }
    return result;
}

template <class T>
static int compare_scalars(const T& x, const T& y) {
    return (x < y) ? -1 : (y < x) ? 1 : 0;
}

int Value::compare(const Value& other) const {
    if (kind_ != other.kind_) throw_wrong_kind(kind_, other.kind_);
    switch (kind_) {
        case Kind::NONE:
            return 0;
        case Kind::INT:
            return compare_scalars(int_, other.int_);
        case Kind::BOOL:
            return compare_scalars(bool_, other.bool_);
        case Kind::STRING:
            return compare_scalars(string_, other.string_);
        case Kind::HANDLE:
            return compare_scalars(id_, other.id_);
        case Kind::RECORD:
        case Kind::BAG: {
            const auto& xs = *items_;
            const auto& ys = *other.items_;
            for (size_t i = 0; i < xs.size() and i < ys.size(); ++i) {
                if (int c = xs[i].compare(ys[i])) return c;
            }
            return compare_scalars(xs.size(), ys.size());
        }
    }
    return 0;
}

std::ostream& operator<<(std::ostream& os, const Value& value) {
    switch (value.kind()) {
        case Value::Kind::NONE:
            return os << "none";
        case Value::Kind::INT:
            return os << value.as_int();
        case Value::Kind::BOOL:
            return os << (value.as_bool() ? "true" : "false");
        case Value::Kind::STRING:
            return os << '"' << value.as_string() << '"';
        case Value::Kind::RECORD: {
            const Type& type = *value.type();
            os << type.name() << "{";
            for (size_t i = 0; i < type.fields().size(); ++i) {
                if (i) os << ", ";
                os << type.fields()[i].first << " = " << value.fields()[i];
            }
            return os << "}";
        }
        case Value::Kind::HANDLE:
            return os << value.type()->name() << "#" << value.handle_id()
                      << value.handle_val();
        case Value::Kind::BAG:
            return os << value.as_bag();
    }
    return os;
}

//----------------------------------------------------------------------------
// Bags

Bag::Bag() : items_(std::make_shared<const std::vector<Value>>()) {}

Bag::Bag(std::vector<Value> items)
    : items_(std::make_shared<const std::vector<Value>>(std::move(items))) {}

size_t Bag::count(const Value& value) const {
    size_t result = 0;
    for (const auto& item : *items_) {
        if (item == value) ++result;
    }
    return result;
}

bool Bag::contains(const Value& value) const {
    for (const auto& item : *items_) {
        if (item == value) return true;
    }
    return false;
}

Bag Bag::insert(const Value& value) const {
    std::vector<Value> items(*items_);
    items.push_back(value);
    return Bag(std::move(items));
}

Bag Bag::remove(const Value& value) const {
    std::vector<Value> items(*items_);
    for (auto i = items.begin(); i != items.end(); ++i) {
        if (*i == value) {
            items.erase(i);
            return Bag(std::move(items));
        }
    }
    return *this;
}

Bag Bag::merge(const Bag& other) const {
    std::vector<Value> items(*items_);
    items.insert(items.end(), other.begin(), other.end());
    return Bag(std::move(items));
}

Bag Bag::subtract(const Bag& other) const {
    std::unordered_map<Value, size_t, ValueHash> pending;
    for (const auto& item : other) {
        ++pending[item];
    }
    std::vector<Value> items;
    for (const auto& item : *items_) {
        auto i = pending.find(item);
        if (i != pending.end() and i->second) {
            --i->second;
        } else {
            items.push_back(item);
        }
    }
    return Bag(std::move(items));
}

bool Bag::operator==(const Bag& other) const {
    if (items_ == other.items_) return true;
    if (size() != other.size()) return false;
    std::unordered_map<Value, size_t, ValueHash> counts;
    for (const auto& item : *items_) {
        ++counts[item];
    }
    for (const auto& item : other) {
        auto i = counts.find(item);
        if (i == counts.end() or i->second == 0) return false;
        --i->second;
    }
    return true;
}

size_t Bag::hash() const {
    size_t result = 0;
    for (const auto& item : *items_) {
        result += item.hash();
    }
    return result;
}

std::ostream& operator<<(std::ostream& os, const Bag& bag) {
    os << "[";
    bool first = true;
    for (const auto& item : bag) {
        if (not first) os << ", ";
        first = false;
        os << item;
    }
    return os << "]";
}

//----------------------------------------------------------------------------
// Conformance

bool conforms(const Value& value, const Type& type, std::string& error) {
    std::ostringstream message;
    switch (type.kind()) {
        case TypeKind::INT:
            if (value.kind() == Value::Kind::INT) return true;
            break;
        case TypeKind::BOOL:
            if (value.kind() == Value::Kind::BOOL) return true;
            break;
        case TypeKind::STRING:
            if (value.kind() == Value::Kind::STRING) return true;
            break;
        case TypeKind::RECORD: {
            if (value.kind() != Value::Kind::RECORD) break;
            const Type& actual = *value.type();
            if (actual.name() != type.name() or
                actual.fields().size() != type.fields().size()) {
                break;
            }
            for (size_t i = 0; i < type.fields().size(); ++i) {
                const Field& field = type.fields()[i];
                if (actual.fields()[i].first != field.first) {
                    message << "expected field " << field.first << " in "
                            << type << ", got " << actual.fields()[i].first;
                    error = message.str();
                    return false;
                }
                if (field.second and
                    not conforms(value.fields()[i], *field.second, error)) {
                    error = field.first + ": " + error;
                    return false;
                }
            }
            return true;
        }
        case TypeKind::HANDLE:
            if (value.kind() != Value::Kind::HANDLE) break;
            if (value.type()->name() != type.name()) break;
            return conforms(value.handle_val(), *type.val_type(), error);
        case TypeKind::BAG: {
            if (value.kind() != Value::Kind::BAG) break;
            for (const auto& item : value.as_bag()) {
                if (not conforms(item, *type.element(), error)) {
                    error = "bag element: " + error;
                    return false;
                }
            }
            return true;
        }
    }
    message << "expected " << type << ", got " << value;
    error = message.str();
    return false;
}

void check_conforms(const Value& value, const Type& type) {
    std::string error;
    if (not conforms(value, type, error)) {
        throw TypeMismatch(error);
    }
}

//----------------------------------------------------------------------------
// Identity

bool HandleIndex::add(const Value& value, std::string& error) {
    switch (value.kind()) {
        case Value::Kind::HANDLE: {
            const Identity identity(value.type()->name(), value.handle_id());
            auto inserted = m_vals.insert({identity, value.handle_val()});
            if (not inserted.second and
                inserted.first->second != value.handle_val()) {
                std::ostringstream message;
                message << identity.first << " #" << identity.second
                        << " carries " << value.handle_val() << ", expected "
                        << inserted.first->second;
                error = message.str();
                return false;
            }
            // Nested handles may differ even when the vals compare equal.
            return add(value.handle_val(), error);
        }
        case Value::Kind::RECORD:
            for (const auto& field : value.fields()) {
                if (not add(field, error)) return false;
            }
            return true;
        case Value::Kind::BAG:
            for (const auto& item : value.as_bag()) {
                if (not add(item, error)) return false;
            }
            return true;
        default:
            return true;
    }
}

bool HandleIndex::agrees(const HandleIndex& other, std::string& error) const {
    const HandleIndex& small = size() < other.size() ? *this : other;
    const HandleIndex& large = size() < other.size() ? other : *this;
    for (const auto& pair : small.m_vals) {
        auto i = large.m_vals.find(pair.first);
        if (i != large.m_vals.end() and i->second != pair.second) {
            std::ostringstream message;
            message << pair.first.first << " #" << pair.first.second
                    << " carries " << other.m_vals.at(pair.first)
                    << ", expected " << m_vals.at(pair.first);
            error = message.str();
            return false;
        }
    }
    return true;
}

void HandleIndex::merge(const HandleIndex& other) {
    m_vals.insert(other.m_vals.begin(), other.m_vals.end());
}

uint64_t HandleIndex::max_id() const {
    uint64_t result = 0;
    for (const auto& pair : m_vals) {
        result = std::max(result, pair.first.second);
    }
    return result;
}

}  // namespace invar
