#include <invar/eval/evaluator.hpp>
#include <unordered_set>

namespace invar {

namespace {

void fail(const Expr& expr, const std::string& problem) {
    std::ostringstream message;
    message << problem << " in " << expr;
    throw EvaluationError(message.str());
}

const Value& expect(const Expr& expr, const Value& value, Value::Kind kind) {
    if (unlikely(value.kind() != kind)) {
        std::ostringstream message;
        message << "expected " << value_kind_name(kind) << ", got "
                << value_kind_name(value.kind());
        fail(expr, message.str());
    }
    return value;
}

Int eval_int(const Expr& expr, const ExprPtr& arg, Env& env) {
    return expect(expr, eval(arg, env), Value::Kind::INT).as_int();
}

Bag eval_bag(const Expr& expr, const ExprPtr& arg, Env& env) {
    return expect(expr, eval(arg, env), Value::Kind::BAG).as_bag();
}

bool eval_bool_arg(const Expr& expr, const ExprPtr& arg, Env& env) {
    return expect(expr, eval(arg, env), Value::Kind::BOOL).as_bool();
}

// Equality requires operands of the same kind; handles also need the same
// handle type.
bool eval_equal(const Expr& expr, Env& env) {
    const Value lhs = eval(expr.args[0], env);
    const Value rhs = eval(expr.args[1], env);
    expect(expr, rhs, lhs.kind());
    return lhs == rhs;
}

int eval_compare(const Expr& expr, Env& env) {
    const Value lhs = eval(expr.args[0], env);
    const Value rhs = eval(expr.args[1], env);
    if (lhs.kind() != Value::Kind::INT and lhs.kind() != Value::Kind::STRING) {
        fail(expr, std::string("cannot order ") +
                       value_kind_name(lhs.kind()) + " values");
    }
    expect(expr, rhs, lhs.kind());
    return lhs.compare(rhs);
}

Value eval_field(const Expr& expr, Env& env) {
    const Value base = eval(expr.args[0], env);
    if (unlikely(not base.has_field(expr.name))) {
        std::ostringstream message;
        message << "no field " << expr.name << " on " << base;
        fail(expr, message.str());
    }
    return base.field(expr.name);
}

Value eval_record(const Expr& expr, Env& env) {
    std::vector<Field> fields;
    std::vector<Value> values;
    for (size_t i = 0; i < expr.args.size(); ++i) {
        fields.emplace_back(expr.names[i], TypePtr());
        values.push_back(eval(expr.args[i], env));
    }
    return Value::record(Type::record("", std::move(fields)),
                         std::move(values));
}

// Enumerates the bindings of clauses[i...] that satisfy every filter, in
// generator order. Returns false iff the visitor asked to stop.
template <class Visitor>
bool for_each_binding(const Expr& expr, size_t i, Env& env, Visitor& visit) {
    if (i == expr.clauses.size()) {
        return visit();
    }
    const Clause& clause = expr.clauses[i];
    if (clause.kind == Clause::FILTER) {
        if (not eval_bool_arg(expr, clause.expr, env)) return true;
        return for_each_binding(expr, i + 1, env, visit);
    }
    const Bag source = eval_bag(expr, clause.expr, env);
    for (const Value& item : source) {
        Env::Let let(env, clause.var, item);
        if (not for_each_binding(expr, i + 1, env, visit)) return false;
    }
    return true;
}

bool eval_exists(const Expr& expr, Env& env) {
    bool found = false;
    auto visit = [&found]() {
        found = true;
        return false;
    };
    for_each_binding(expr, 0, env, visit);
    return found;
}

bool eval_all(const Expr& expr, Env& env) {
    bool holds = true;
    auto visit = [&]() {
        holds = eval_bool_arg(expr, expr.head(), env);
        return holds;
    };
    for_each_binding(expr, 0, env, visit);
    return holds;
}

bool eval_unique(const Expr& expr, Env& env) {
    std::unordered_set<Value, ValueHash> seen;
    bool distinct = true;
    auto visit = [&]() {
        distinct = seen.insert(eval(expr.head(), env)).second;
        return distinct;
    };
    for_each_binding(expr, 0, env, visit);
    return distinct;
}

Bag eval_comprehension(const Expr& expr, Env& env) {
    std::vector<Value> items;
    auto visit = [&]() {
        items.push_back(eval(expr.head(), env));
        return true;
    };
    for_each_binding(expr, 0, env, visit);
    return Bag(std::move(items));
}

}  // namespace

Value eval(const ExprPtr& expr_ptr, Env& env) {
    const Expr& expr = *expr_ptr;
    switch (expr.kind) {
        case ExprKind::LITERAL:
            return expr.literal;

        case ExprKind::VAR: {
            const Value* value = env.find(expr.name);
            if (unlikely(not value)) fail(expr, "unbound variable");
            return *value;
        }

        case ExprKind::STATE: {
            const Bag* bag = env.state().find(expr.name);
            if (unlikely(not bag)) fail(expr, "unknown state variable");
            return Value::bag(*bag);
        }

        case ExprKind::FIELD:
            return eval_field(expr, env);

        case ExprKind::MAKE_RECORD:
            return eval_record(expr, env);

        case ExprKind::NOT:
            return Value::from_bool(not eval_bool_arg(expr, expr.args[0], env));

        case ExprKind::NEG:
            return Value::from_int(-eval_int(expr, expr.args[0], env));

        case ExprKind::AND:
            return Value::from_bool(eval_bool_arg(expr, expr.args[0], env) and
                                    eval_bool_arg(expr, expr.args[1], env));

        case ExprKind::OR:
            return Value::from_bool(eval_bool_arg(expr, expr.args[0], env) or
                                    eval_bool_arg(expr, expr.args[1], env));

        case ExprKind::IMPLIES:
            return Value::from_bool(
                not eval_bool_arg(expr, expr.args[0], env) or
                eval_bool_arg(expr, expr.args[1], env));

        case ExprKind::EQ:
            return Value::from_bool(eval_equal(expr, env));
        case ExprKind::NE:
            return Value::from_bool(not eval_equal(expr, env));
        case ExprKind::LT:
            return Value::from_bool(eval_compare(expr, env) < 0);
        case ExprKind::LE:
            return Value::from_bool(eval_compare(expr, env) <= 0);
        case ExprKind::GT:
            return Value::from_bool(eval_compare(expr, env) > 0);
        case ExprKind::GE:
            return Value::from_bool(eval_compare(expr, env) >= 0);

        case ExprKind::ADD:
        case ExprKind::SUB:
        case ExprKind::MUL: {
            const Int lhs = eval_int(expr, expr.args[0], env);
            const Int rhs = eval_int(expr, expr.args[1], env);
            switch (expr.kind) {
                case ExprKind::ADD:
                    return Value::from_int(lhs + rhs);
                case ExprKind::SUB:
                    return Value::from_int(lhs - rhs);
                default:
                    return Value::from_int(lhs * rhs);
            }
        }

        case ExprKind::IN: {
            const Value elem = eval(expr.args[0], env);
            return Value::from_bool(
                eval_bag(expr, expr.args[1], env).contains(elem));
        }

        case ExprKind::LEN:
            return Value::from_int(eval_bag(expr, expr.args[0], env).size());

        case ExprKind::SUM: {
            Int total = 0;
            for (const Value& item : eval_bag(expr, expr.args[0], env)) {
                total += expect(expr, item, Value::Kind::INT).as_int();
            }
            return Value::from_int(total);
        }

        case ExprKind::EMPTY_BAG:
            return Value::bag(Bag());

        case ExprKind::SINGLETON: {
            std::vector<Value> items(1, eval(expr.args[0], env));
            return Value::bag(Bag(std::move(items)));
        }

        case ExprKind::BAG_UNION: {
            const Bag lhs = eval_bag(expr, expr.args[0], env);
            return Value::bag(lhs.merge(eval_bag(expr, expr.args[1], env)));
        }

        case ExprKind::BAG_DIFF: {
            const Bag lhs = eval_bag(expr, expr.args[0], env);
            return Value::bag(lhs.subtract(eval_bag(expr, expr.args[1], env)));
        }

        case ExprKind::COMPREHENSION:
            return Value::bag(eval_comprehension(expr, env));
        case ExprKind::EXISTS:
            return Value::from_bool(eval_exists(expr, env));
        case ExprKind::ALL:
            return Value::from_bool(eval_all(expr, env));
        case ExprKind::UNIQUE:
            return Value::from_bool(eval_unique(expr, env));
    }
    INVAR_ERROR("unknown expression kind");
}

bool eval_bool(const ExprPtr& expr, Env& env) {
    return expect(*expr, eval(expr, env), Value::Kind::BOOL).as_bool();
}

Status try_eval(const ExprPtr& expr, Env& env, Value& result) {
    try {
        result = eval(expr, env);
    } catch (const EvaluationError& e) {
        return Status(ErrorCode::EVALUATION_ERROR, e.message);
    }
    return Status();
}

}  // namespace invar
