#include <atomic>
#include <invar/eval/expr.hpp>

namespace invar {

const char* expr_kind_name(ExprKind kind) {
    switch (kind) {
        case ExprKind::LITERAL:
            return "LITERAL";
        case ExprKind::VAR:
            return "VAR";
        case ExprKind::STATE:
            return "STATE";
        case ExprKind::FIELD:
            return "FIELD";
        case ExprKind::MAKE_RECORD:
            return "MAKE_RECORD";
        case ExprKind::NOT:
            return "NOT";
        case ExprKind::NEG:
            return "NEG";
        case ExprKind::AND:
            return "AND";
        case ExprKind::OR:
            return "OR";
        case ExprKind::IMPLIES:
            return "IMPLIES";
        case ExprKind::EQ:
            return "EQ";
        case ExprKind::NE:
            return "NE";
        case ExprKind::LT:
            return "LT";
        case ExprKind::LE:
            return "LE";
        case ExprKind::GT:
            return "GT";
        case ExprKind::GE:
            return "GE";
        case ExprKind::ADD:
            return "ADD";
        case ExprKind::SUB:
            return "SUB";
        case ExprKind::MUL:
            return "MUL";
        case ExprKind::IN:
            return "IN";
        case ExprKind::LEN:
            return "LEN";
        case ExprKind::SUM:
            return "SUM";
        case ExprKind::EMPTY_BAG:
            return "EMPTY_BAG";
        case ExprKind::SINGLETON:
            return "SINGLETON";
        case ExprKind::BAG_UNION:
            return "BAG_UNION";
        case ExprKind::BAG_DIFF:
            return "BAG_DIFF";
        case ExprKind::COMPREHENSION:
            return "COMPREHENSION";
        case ExprKind::EXISTS:
            return "EXISTS";
        case ExprKind::ALL:
            return "ALL";
        case ExprKind::UNIQUE:
            return "UNIQUE";
    }
    return "???";
}

//----------------------------------------------------------------------------
// Printing

static const char* binary_symbol(ExprKind kind) {
    switch (kind) {
        case ExprKind::AND:
            return "and";
        case ExprKind::OR:
            return "or";
        case ExprKind::IMPLIES:
            return "=>";
        case ExprKind::EQ:
            return "==";
        case ExprKind::NE:
            return "!=";
        case ExprKind::LT:
            return "<";
        case ExprKind::LE:
            return "<=";
        case ExprKind::GT:
            return ">";
        case ExprKind::GE:
            return ">=";
        case ExprKind::ADD:
        case ExprKind::BAG_UNION:
            return "+";
        case ExprKind::SUB:
        case ExprKind::BAG_DIFF:
            return "-";
        case ExprKind::MUL:
            return "*";
        case ExprKind::IN:
            return "in";
        default:
            return nullptr;
    }
}

std::ostream& operator<<(std::ostream& os, const Expr& expr) {
    switch (expr.kind) {
        case ExprKind::LITERAL:
            return os << expr.literal;
        case ExprKind::VAR:
        case ExprKind::STATE:
            return os << expr.name;
        case ExprKind::FIELD:
            return os << *expr.args[0] << "." << expr.name;
        case ExprKind::MAKE_RECORD: {
            os << "{";
            for (size_t i = 0; i < expr.args.size(); ++i) {
                if (i) os << ", ";
                os << expr.names[i] << " = " << *expr.args[i];
            }
            return os << "}";
        }
        case ExprKind::NOT:
            return os << "not " << *expr.args[0];
        case ExprKind::NEG:
            return os << "-" << *expr.args[0];
        case ExprKind::LEN:
            return os << "len " << *expr.args[0];
        case ExprKind::SUM:
            return os << "sum " << *expr.args[0];
        case ExprKind::EMPTY_BAG:
            return os << "[]";
        case ExprKind::SINGLETON:
            return os << "[" << *expr.args[0] << "]";
        case ExprKind::COMPREHENSION:
        case ExprKind::EXISTS:
        case ExprKind::ALL:
        case ExprKind::UNIQUE: {
            switch (expr.kind) {
                case ExprKind::EXISTS:
                    os << "exists ";
                    break;
                case ExprKind::ALL:
                    os << "all ";
                    break;
                case ExprKind::UNIQUE:
                    os << "unique ";
                    break;
                default:
                    break;
            }
            os << "[" << *expr.head();
            const char* sep = " | ";
            for (const auto& clause : expr.clauses) {
                os << sep;
                sep = ", ";
                if (clause.kind == Clause::GENERATOR) {
                    os << clause.var << " <- ";
                }
                os << *clause.expr;
            }
            return os << "]";
        }
        default: {
            const char* symbol = binary_symbol(expr.kind);
            INVAR_ASSERT(symbol, "unprintable " << expr_kind_name(expr.kind));
            return os << "(" << *expr.args[0] << " " << symbol << " "
                      << *expr.args[1] << ")";
        }
    }
}

std::string print_expr(const ExprPtr& expr) {
    std::ostringstream os;
    os << *expr;
    return os.str();
}

//----------------------------------------------------------------------------
// Construction

static std::shared_ptr<Expr> new_expr(ExprKind kind) {
    return std::make_shared<Expr>(kind);
}

ExprPtr make_unary(ExprKind kind, ExprPtr arg) {
    INVAR_ASSERT(arg, "null operand for " << expr_kind_name(kind));
    auto result = new_expr(kind);
    result->args.push_back(std::move(arg));
    return result;
}

ExprPtr make_binary(ExprKind kind, ExprPtr lhs, ExprPtr rhs) {
    INVAR_ASSERT(lhs and rhs, "null operand for " << expr_kind_name(kind));
    auto result = new_expr(kind);
    result->args.push_back(std::move(lhs));
    result->args.push_back(std::move(rhs));
    return result;
}

ExprPtr make_comprehension(ExprKind kind, ExprPtr head,
                           std::vector<Clause> clauses) {
    INVAR_ASSERT(head, "null head for " << expr_kind_name(kind));
    auto result = new_expr(kind);
    result->args.push_back(std::move(head));
    result->clauses = std::move(clauses);
    return result;
}

ExprPtr with_args(const ExprPtr& expr, std::vector<ExprPtr> args) {
    auto result = std::make_shared<Expr>(*expr);
    result->args = std::move(args);
    return result;
}

namespace dsl {

ExprPtr lit(const Value& value) {
    auto result = new_expr(ExprKind::LITERAL);
    result->literal = value;
    return result;
}

ExprPtr int_lit(long value) { return lit(Value::from_int(value)); }
ExprPtr bool_lit(bool value) { return lit(Value::from_bool(value)); }
ExprPtr str_lit(const std::string& value) {
    return lit(Value::from_string(value));
}

ExprPtr var(const std::string& name) {
    auto result = new_expr(ExprKind::VAR);
    result->name = name;
    return result;
}

ExprPtr state(const std::string& name) {
    auto result = new_expr(ExprKind::STATE);
    result->name = name;
    return result;
}

ExprPtr dot(ExprPtr expr, const std::string& field) {
    auto result = new_expr(ExprKind::FIELD);
    result->name = field;
    result->args.push_back(std::move(expr));
    return result;
}

ExprPtr record(std::vector<std::pair<std::string, ExprPtr>> fields) {
    auto result = new_expr(ExprKind::MAKE_RECORD);
    for (auto& field : fields) {
        result->names.push_back(field.first);
        result->args.push_back(std::move(field.second));
    }
    return result;
}

ExprPtr not_(ExprPtr arg) { return make_unary(ExprKind::NOT, arg); }
ExprPtr neg(ExprPtr arg) { return make_unary(ExprKind::NEG, arg); }

ExprPtr and_(ExprPtr lhs, ExprPtr rhs) {
    return make_binary(ExprKind::AND, lhs, rhs);
}

ExprPtr and_(const std::vector<ExprPtr>& args) {
    if (args.empty()) return bool_lit(true);
    ExprPtr result = args.back();
    for (size_t i = args.size() - 1; i--;) {
        result = and_(args[i], result);
    }
    return result;
}

ExprPtr or_(ExprPtr lhs, ExprPtr rhs) {
    return make_binary(ExprKind::OR, lhs, rhs);
}

ExprPtr or_(const std::vector<ExprPtr>& args) {
    if (args.empty()) return bool_lit(false);
    ExprPtr result = args.back();
    for (size_t i = args.size() - 1; i--;) {
        result = or_(args[i], result);
    }
    return result;
}

ExprPtr implies(ExprPtr lhs, ExprPtr rhs) {
    return make_binary(ExprKind::IMPLIES, lhs, rhs);
}

ExprPtr eq(ExprPtr lhs, ExprPtr rhs) {
    return make_binary(ExprKind::EQ, lhs, rhs);
}
ExprPtr ne(ExprPtr lhs, ExprPtr rhs) {
    return make_binary(ExprKind::NE, lhs, rhs);
}
ExprPtr lt(ExprPtr lhs, ExprPtr rhs) {
    return make_binary(ExprKind::LT, lhs, rhs);
}
ExprPtr le(ExprPtr lhs, ExprPtr rhs) {
    return make_binary(ExprKind::LE, lhs, rhs);
}
ExprPtr gt(ExprPtr lhs, ExprPtr rhs) {
    return make_binary(ExprKind::GT, lhs, rhs);
}
ExprPtr ge(ExprPtr lhs, ExprPtr rhs) {
    return make_binary(ExprKind::GE, lhs, rhs);
}
ExprPtr add(ExprPtr lhs, ExprPtr rhs) {
    return make_binary(ExprKind::ADD, lhs, rhs);
}
ExprPtr sub(ExprPtr lhs, ExprPtr rhs) {
    return make_binary(ExprKind::SUB, lhs, rhs);
}
ExprPtr mul(ExprPtr lhs, ExprPtr rhs) {
    return make_binary(ExprKind::MUL, lhs, rhs);
}
ExprPtr in(ExprPtr elem, ExprPtr bag) {
    return make_binary(ExprKind::IN, elem, bag);
}
ExprPtr len(ExprPtr bag) { return make_unary(ExprKind::LEN, bag); }
ExprPtr sum(ExprPtr bag) { return make_unary(ExprKind::SUM, bag); }

ExprPtr empty_bag() { return new_expr(ExprKind::EMPTY_BAG); }
ExprPtr singleton(ExprPtr elem) {
    return make_unary(ExprKind::SINGLETON, elem);
}
ExprPtr bag_union(ExprPtr lhs, ExprPtr rhs) {
    return make_binary(ExprKind::BAG_UNION, lhs, rhs);
}
ExprPtr bag_diff(ExprPtr lhs, ExprPtr rhs) {
    return make_binary(ExprKind::BAG_DIFF, lhs, rhs);
}

Clause gen(const std::string& var, ExprPtr source) {
    return Clause{Clause::GENERATOR, var, std::move(source)};
}

Clause filter(ExprPtr cond) {
    return Clause{Clause::FILTER, std::string(), std::move(cond)};
}

ExprPtr comprehension(ExprPtr head, std::vector<Clause> clauses) {
    return make_comprehension(ExprKind::COMPREHENSION, head,
                              std::move(clauses));
}
ExprPtr exists(ExprPtr head, std::vector<Clause> clauses) {
    return make_comprehension(ExprKind::EXISTS, head, std::move(clauses));
}
ExprPtr all(ExprPtr cond, std::vector<Clause> clauses) {
    return make_comprehension(ExprKind::ALL, cond, std::move(clauses));
}
ExprPtr unique(ExprPtr head, std::vector<Clause> clauses) {
    return make_comprehension(ExprKind::UNIQUE, head, std::move(clauses));
}

}  // namespace dsl

//----------------------------------------------------------------------------
// Analysis

std::string fresh_name(const std::string& base) {
    static std::atomic<uint64_t> counter(0);
    const std::string stem = base.substr(0, base.find('%'));
    return stem + "%" + std::to_string(++counter);
}

static void collect_free_vars(const ExprPtr& expr,
                              std::vector<std::string>& bound,
                              std::set<std::string>& result) {
    switch (expr->kind) {
        case ExprKind::VAR: {
            for (const auto& name : bound) {
                if (name == expr->name) return;
            }
            result.insert(expr->name);
            return;
        }
        case ExprKind::COMPREHENSION:
        case ExprKind::EXISTS:
        case ExprKind::ALL:
        case ExprKind::UNIQUE: {
            const size_t depth = bound.size();
            for (const auto& clause : expr->clauses) {
                collect_free_vars(clause.expr, bound, result);
                if (clause.kind == Clause::GENERATOR) {
                    bound.push_back(clause.var);
                }
            }
            collect_free_vars(expr->head(), bound, result);
            bound.resize(depth);
            return;
        }
        default:
            for (const auto& arg : expr->args) {
                collect_free_vars(arg, bound, result);
            }
    }
}

std::set<std::string> free_vars(const ExprPtr& expr) {
    std::vector<std::string> bound;
    std::set<std::string> result;
    collect_free_vars(expr, bound, result);
    return result;
}

static void collect_state_vars(const ExprPtr& expr,
                               std::set<std::string>& result) {
    if (expr->kind == ExprKind::STATE) {
        result.insert(expr->name);
    }
    for (const auto& arg : expr->args) {
        collect_state_vars(arg, result);
    }
    for (const auto& clause : expr->clauses) {
        collect_state_vars(clause.expr, result);
    }
}

std::set<std::string> state_vars(const ExprPtr& expr) {
    std::set<std::string> result;
    collect_state_vars(expr, result);
    return result;
}

//----------------------------------------------------------------------------
// Substitution

namespace {

struct Target {
    ExprKind kind;  // VAR or STATE
    std::string name;
    ExprPtr value;
    std::set<std::string> value_free_vars;
};

ExprPtr subst(const ExprPtr& expr, const Target& target);

// Renames the variable bound by clauses[i] in its scope: later clauses up to
// and including a rebinding generator, and the head unless rebound.
void rename_binder(std::vector<Clause>& clauses, size_t i, ExprPtr& head,
                   const std::string& renamed) {
    const std::string bound = clauses[i].var;
    const Target rename = {ExprKind::VAR, bound, dsl::var(renamed), {renamed}};
    bool shadowed = false;
    for (size_t j = i + 1; j < clauses.size() and not shadowed; ++j) {
        clauses[j].expr = subst(clauses[j].expr, rename);
        shadowed = clauses[j].kind == Clause::GENERATOR and
                   clauses[j].var == bound;
    }
    if (not shadowed) {
        head = subst(head, rename);
    }
    clauses[i].var = renamed;
}

ExprPtr subst_comprehension(const ExprPtr& expr, const Target& target) {
    std::vector<Clause> clauses = expr->clauses;
    ExprPtr head = expr->head();
    for (size_t i = 0; i < clauses.size(); ++i) {
        clauses[i].expr = subst(clauses[i].expr, target);
        if (clauses[i].kind != Clause::GENERATOR) continue;
        const std::string bound = clauses[i].var;
        if (target.kind == ExprKind::VAR and bound == target.name) {
            // Shadowed: the rest of the comprehension is untouched.
            return make_comprehension(expr->kind, head, std::move(clauses));
        }
        if (target.value_free_vars.count(bound)) {
            rename_binder(clauses, i, head, fresh_name(bound));
        }
    }
    head = subst(head, target);
    return make_comprehension(expr->kind, head, std::move(clauses));
}

ExprPtr subst(const ExprPtr& expr, const Target& target) {
    switch (expr->kind) {
        case ExprKind::VAR:
        case ExprKind::STATE:
            if (expr->kind == target.kind and expr->name == target.name) {
                return target.value;
            }
            return expr;
        case ExprKind::LITERAL:
        case ExprKind::EMPTY_BAG:
            return expr;
        case ExprKind::COMPREHENSION:
        case ExprKind::EXISTS:
        case ExprKind::ALL:
        case ExprKind::UNIQUE:
            return subst_comprehension(expr, target);
        default: {
            std::vector<ExprPtr> args;
            bool changed = false;
            for (const auto& arg : expr->args) {
                args.push_back(subst(arg, target));
                changed = changed or args.back() != arg;
            }
            return changed ? with_args(expr, std::move(args)) : expr;
        }
    }
}

}  // namespace

ExprPtr substitute(const ExprPtr& expr, const std::string& var,
                   const ExprPtr& value) {
    const Target target = {ExprKind::VAR, var, value, free_vars(value)};
    return subst(expr, target);
}

ExprPtr substitute_state(const ExprPtr& expr, const std::string& name,
                         const ExprPtr& value) {
    const Target target = {ExprKind::STATE, name, value, free_vars(value)};
    return subst(expr, target);
}

ExprPtr freshen(const ExprPtr& expr) {
    if (expr->is_comprehension()) {
        std::vector<Clause> clauses = expr->clauses;
        ExprPtr head = expr->head();
        for (size_t i = 0; i < clauses.size(); ++i) {
            clauses[i].expr = freshen(clauses[i].expr);
            if (clauses[i].kind != Clause::GENERATOR) continue;
            rename_binder(clauses, i, head, fresh_name(clauses[i].var));
        }
        return make_comprehension(expr->kind, freshen(head),
                                  std::move(clauses));
    }
    if (expr->args.empty()) return expr;
    std::vector<ExprPtr> args;
    for (const auto& arg : expr->args) {
        args.push_back(freshen(arg));
    }
    return with_args(expr, std::move(args));
}

//----------------------------------------------------------------------------
// Alpha equivalence

namespace {

typedef std::vector<std::pair<std::string, std::string>> BinderPairs;

bool alpha_eq(const ExprPtr& x, const ExprPtr& y, BinderPairs& bound) {
    if (x->kind != y->kind) return false;
    switch (x->kind) {
        case ExprKind::LITERAL:
            return x->literal == y->literal;
        case ExprKind::VAR: {
            for (size_t i = bound.size(); i--;) {
                const bool x_bound = bound[i].first == x->name;
                const bool y_bound = bound[i].second == y->name;
                if (x_bound or y_bound) return x_bound and y_bound;
            }
            return x->name == y->name;
        }
        case ExprKind::STATE:
            return x->name == y->name;
        case ExprKind::COMPREHENSION:
        case ExprKind::EXISTS:
        case ExprKind::ALL:
        case ExprKind::UNIQUE: {
            if (x->clauses.size() != y->clauses.size()) return false;
            const size_t depth = bound.size();
            bool result = true;
            for (size_t i = 0; result and i < x->clauses.size(); ++i) {
                const Clause& cx = x->clauses[i];
                const Clause& cy = y->clauses[i];
                result = cx.kind == cy.kind and alpha_eq(cx.expr, cy.expr, bound);
                if (result and cx.kind == Clause::GENERATOR) {
                    bound.push_back({cx.var, cy.var});
                }
            }
            result = result and alpha_eq(x->head(), y->head(), bound);
            bound.resize(depth);
            return result;
        }
        default: {
            if (x->name != y->name or x->names != y->names or
                x->args.size() != y->args.size()) {
                return false;
            }
            for (size_t i = 0; i < x->args.size(); ++i) {
                if (not alpha_eq(x->args[i], y->args[i], bound)) return false;
            }
            return true;
        }
    }
}

void write_key(const ExprPtr& expr, std::vector<std::string>& bound,
               std::ostream& os) {
    switch (expr->kind) {
        case ExprKind::LITERAL:
            os << "(LITERAL " << value_kind_name(expr->literal.kind()) << " "
               << expr->literal << ")";
            return;
        case ExprKind::VAR: {
            for (size_t i = bound.size(); i--;) {
                if (bound[i] == expr->name) {
                    os << "$" << i;
                    return;
                }
            }
            os << expr->name;
            return;
        }
        case ExprKind::STATE:
            os << "@" << expr->name;
            return;
        default:
            break;
    }
    os << "(" << expr_kind_name(expr->kind);
    if (not expr->name.empty()) os << " ." << expr->name;
    for (const auto& name : expr->names) os << " ." << name;
    const size_t depth = bound.size();
    for (const auto& clause : expr->clauses) {
        os << (clause.kind == Clause::GENERATOR ? " <- " : " | ");
        write_key(clause.expr, bound, os);
        if (clause.kind == Clause::GENERATOR) {
            bound.push_back(clause.var);
        }
    }
    for (const auto& arg : expr->args) {
        os << " ";
        write_key(arg, bound, os);
    }
    bound.resize(depth);
    os << ")";
}

}  // namespace

bool alpha_equivalent(const ExprPtr& lhs, const ExprPtr& rhs) {
    BinderPairs bound;
    return alpha_eq(lhs, rhs, bound);
}

std::string canonical_key(const ExprPtr& expr) {
    std::vector<std::string> bound;
    std::ostringstream os;
    write_key(expr, bound, os);
    return os.str();
}

}  // namespace invar
