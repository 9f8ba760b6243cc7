#include <invar/model/schema.hpp>

namespace invar {

Status check_params(const std::vector<Param>& formals,
                    const std::vector<Value>& actuals) {
    if (formals.size() != actuals.size()) {
        std::ostringstream message;
        message << "expected " << formals.size() << " parameters, got "
                << actuals.size();
        return Status(ErrorCode::PARAMETER_ERROR, message.str());
    }
    for (size_t i = 0; i < formals.size(); ++i) {
        std::string error;
        if (not conforms(actuals[i], *formals[i].type, error)) {
            return Status(ErrorCode::PARAMETER_ERROR,
                          formals[i].name + ": " + error);
        }
    }
    return Status();
}

const char* effect_kind_name(Effect::Kind kind) {
    switch (kind) {
        case Effect::INSERT:
            return "insert";
        case Effect::REMOVE:
            return "remove";
    }
    return "???";
}

std::set<std::string> Operation::writes() const {
    std::set<std::string> result;
    for (const auto& effect : effects) {
        result.insert(effect.target);
    }
    return result;
}

//----------------------------------------------------------------------------
// Declaration

void Schema::add_type(TypePtr type) {
    INVAR_ASSERT(type, "null type");
    INVAR_ASSERT(not type->name().empty(), "anonymous type " << *type);
    const std::string name = type->name();
    INVAR_ASSERT(types_.insert({name, std::move(type)}).second,
                 "duplicate type " << name);
}

void Schema::add_state(const std::string& name, TypePtr bag_type) {
    INVAR_ASSERT(bag_type and bag_type->kind() == TypeKind::BAG,
                 "state " << name << " must have a bag type");
    INVAR_ASSERT(state_types_.insert({name, std::move(bag_type)}).second,
                 "duplicate state variable " << name);
}

void Schema::add_invariant(const std::string& name, ExprPtr formula) {
    INVAR_ASSERT(formula, "null formula for invariant " << name);
    INVAR_ASSERT(not find_invariant(name), "duplicate invariant " << name);
    invariants_.push_back({name, std::move(formula)});
}

void Schema::add_query(Query query) {
    INVAR_ASSERT(not find_query(query.name), "duplicate query " << query.name);
    queries_.push_back(std::move(query));
}

void Schema::add_operation(Operation operation) {
    INVAR_ASSERT(not find_operation(operation.name),
                 "duplicate operation " << operation.name);
    if (not operation.precondition) {
        operation.precondition = dsl::bool_lit(true);
    }
    operations_.push_back(std::move(operation));
}

const Invariant* Schema::find_invariant(const std::string& name) const {
    for (const auto& invariant : invariants_) {
        if (invariant.name == name) return &invariant;
    }
    return nullptr;
}

const Query* Schema::find_query(const std::string& name) const {
    for (const auto& query : queries_) {
        if (query.name == name) return &query;
    }
    return nullptr;
}

const Operation* Schema::find_operation(const std::string& name) const {
    for (const auto& operation : operations_) {
        if (operation.name == name) return &operation;
    }
    return nullptr;
}

//----------------------------------------------------------------------------
// Validation

namespace {

class Validator {
   public:
    Validator(const Schema& schema, std::vector<std::string>& errors)
        : schema_(schema), errors_(errors) {}

    void check_params(const std::string& where,
                      const std::vector<Param>& params,
                      std::set<std::string>& names) {
        for (const auto& param : params) {
            if (not param.type) {
                error(where) << "parameter " << param.name << " has no type";
            }
            if (not names.insert(param.name).second) {
                error(where) << "duplicate parameter " << param.name;
            }
        }
    }

    // Checks that expr reads only declared state and the given variables.
    void check_scope(const std::string& where, const ExprPtr& expr,
                     const std::set<std::string>& vars) {
        if (not expr) {
            error(where) << "missing expression";
            return;
        }
        for (const auto& name : free_vars(expr)) {
            if (not vars.count(name)) {
                error(where) << "unbound variable " << name << " in "
                             << *expr;
            }
        }
        for (const auto& name : state_vars(expr)) {
            if (not schema_.state_types().count(name)) {
                error(where) << "unknown state variable " << name;
            }
        }
    }

    std::ostream& error(const std::string& where) {
        messages_.emplace_back();
        messages_.back() << where << ": ";
        return messages_.back();
    }

    ~Validator() {
        for (const auto& message : messages_) {
            errors_.push_back(message.str());
        }
    }

   private:
    const Schema& schema_;
    std::vector<std::string>& errors_;
    std::vector<std::ostringstream> messages_;
};

}  // namespace

void Schema::validate(std::vector<std::string>& errors) const {
    Validator validator(*this, errors);
    const std::set<std::string> none;

    for (const auto& invariant : invariants_) {
        const std::string where = "invariant " + invariant.name;
        validator.check_scope(where, invariant.formula, none);
    }

    for (const auto& query : queries_) {
        const std::string where = "query " + query.name;
        std::set<std::string> params;
        validator.check_params(where, query.params, params);
        validator.check_scope(where, query.body, params);
        if (query.body and query.body->kind != ExprKind::COMPREHENSION) {
            validator.error(where) << "body is not a comprehension";
        }
        if (query.order_key) {
            if (query.order_var.empty()) {
                validator.error(where) << "sort key without a row variable";
            }
            params.insert(query.order_var);
            validator.check_scope(where, query.order_key, params);
        }
    }

    for (const auto& operation : operations_) {
        const std::string where = "operation " + operation.name;
        std::set<std::string> params;
        validator.check_params(where, operation.params, params);
        validator.check_scope(where, operation.precondition, params);
        for (const auto& effect : operation.effects) {
            if (not state_types_.count(effect.target)) {
                validator.error(where)
                    << effect_kind_name(effect.kind)
                    << " into unknown state variable " << effect.target;
            }
            validator.check_scope(where, effect.arg, params);
        }
    }
}

}  // namespace invar
