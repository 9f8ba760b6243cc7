#include <invar/verifier/delta.hpp>

namespace invar {

bool is_true(const ExprPtr& expr) {
    return expr->kind == ExprKind::LITERAL and
           expr->literal.kind() == Value::Kind::BOOL and
           expr->literal.as_bool();
}

bool is_false(const ExprPtr& expr) {
    return expr->kind == ExprKind::LITERAL and
           expr->literal.kind() == Value::Kind::BOOL and
           not expr->literal.as_bool();
}

ExprPtr make_not(const ExprPtr& arg) {
    if (is_true(arg)) return dsl::bool_lit(false);
    if (is_false(arg)) return dsl::bool_lit(true);
    if (arg->kind == ExprKind::NOT) return arg->args[0];
    return dsl::not_(arg);
}

ExprPtr make_and(const ExprPtr& lhs, const ExprPtr& rhs) {
    if (is_false(lhs) or is_false(rhs)) return dsl::bool_lit(false);
    if (is_true(lhs)) return rhs;
    if (is_true(rhs)) return lhs;
    return dsl::and_(lhs, rhs);
}

ExprPtr make_or(const ExprPtr& lhs, const ExprPtr& rhs) {
    if (is_true(lhs) or is_true(rhs)) return dsl::bool_lit(true);
    if (is_false(lhs)) return rhs;
    if (is_false(rhs)) return lhs;
    return dsl::or_(lhs, rhs);
}

ExprPtr make_implies(const ExprPtr& lhs, const ExprPtr& rhs) {
    if (is_false(lhs) or is_true(rhs)) return dsl::bool_lit(true);
    if (is_true(lhs)) return rhs;
    if (is_false(rhs)) return make_not(lhs);
    return dsl::implies(lhs, rhs);
}

ExprPtr weakest_post(const ExprPtr& formula, const Operation& operation) {
    ExprPtr result = formula;
    for (auto i = operation.effects.rbegin(); i != operation.effects.rend();
         ++i) {
        const ExprPtr bag = dsl::state(i->target);
        const ExprPtr delta = dsl::singleton(i->arg);
        const ExprPtr updated = (i->kind == Effect::INSERT)
                                    ? dsl::bag_union(bag, delta)
                                    : dsl::bag_diff(bag, delta);
        result = substitute_state(result, i->target, updated);
    }
    return result;
}

//----------------------------------------------------------------------------
// Delta rewriting

namespace {

Polarity flip(Polarity polarity) {
    switch (polarity) {
        case Polarity::POSITIVE:
            return Polarity::NEGATIVE;
        case Polarity::NEGATIVE:
            return Polarity::POSITIVE;
        default:
            return Polarity::NEUTRAL;
    }
}

size_t count_generators(const Expr& expr) {
    size_t count = 0;
    for (const auto& clause : expr.clauses) {
        if (clause.kind == Clause::GENERATOR) ++count;
    }
    return count;
}

std::vector<Clause> slice(const std::vector<Clause>& clauses, size_t begin,
                          size_t end) {
    return std::vector<Clause>(clauses.begin() + begin,
                               clauses.begin() + end);
}

ExprPtr rewrite(const ExprPtr& expr, Polarity polarity);

ExprPtr membership(const ExprPtr& elem, const ExprPtr& bag,
                   Polarity polarity) {
    switch (bag->kind) {
        case ExprKind::EMPTY_BAG:
            return dsl::bool_lit(false);
        case ExprKind::SINGLETON:
            return dsl::eq(elem, bag->args[0]);
        case ExprKind::BAG_UNION:
            return make_or(membership(elem, bag->args[0], polarity),
                           membership(elem, bag->args[1], polarity));
        case ExprKind::BAG_DIFF:
            switch (polarity) {
                case Polarity::POSITIVE:
                    return make_and(
                        membership(elem, bag->args[0], polarity),
                        make_not(membership(elem, bag->args[1],
                                            Polarity::NEGATIVE)));
                case Polarity::NEGATIVE:
                    return membership(elem, bag->args[0], polarity);
                default:
                    return dsl::in(elem, bag);
            }
        case ExprKind::COMPREHENSION: {
            if (count_generators(*bag) == 0) {
                ExprPtr result = dsl::eq(elem, bag->head());
                for (const auto& clause : bag->clauses) {
                    result = make_and(clause.expr, result);
                }
                return result;
            }
            const ExprPtr fresh = freshen(bag);
            std::vector<Clause> clauses = fresh->clauses;
            clauses.push_back(dsl::filter(dsl::eq(fresh->head(), elem)));
            return dsl::exists(dsl::bool_lit(true), std::move(clauses));
        }
        default:
            return dsl::in(elem, bag);
    }
}

ExprPtr cardinality(const ExprPtr& bag) {
    switch (bag->kind) {
        case ExprKind::EMPTY_BAG:
            return dsl::int_lit(0);
        case ExprKind::SINGLETON:
            return dsl::int_lit(1);
        case ExprKind::BAG_UNION:
            return dsl::add(cardinality(bag->args[0]),
                            cardinality(bag->args[1]));
        default:
            return dsl::len(bag);
    }
}

ExprPtr total(const ExprPtr& bag) {
    switch (bag->kind) {
        case ExprKind::EMPTY_BAG:
            return dsl::int_lit(0);
        case ExprKind::SINGLETON:
            return bag->args[0];
        case ExprKind::BAG_UNION:
            return dsl::add(total(bag->args[0]), total(bag->args[1]));
        default:
            return dsl::sum(bag);
    }
}

ExprPtr replace_source(const ExprPtr& expr, size_t i, const ExprPtr& source) {
    std::vector<Clause> clauses = expr->clauses;
    clauses[i].expr = source;
    return make_comprehension(expr->kind, expr->head(), std::move(clauses));
}

// Generator i over a - c, read as generator over a skipping members of c.
ExprPtr replace_source_excluding(const ExprPtr& expr, size_t i) {
    const ExprPtr fresh = freshen(expr);
    std::vector<Clause> clauses = fresh->clauses;
    const ExprPtr source = clauses[i].expr;
    const std::string var = clauses[i].var;
    clauses[i].expr = source->args[0];
    clauses.insert(clauses.begin() + i + 1,
                   dsl::filter(dsl::not_(dsl::in(dsl::var(var),
                                                 source->args[1]))));
    return make_comprehension(expr->kind, fresh->head(), std::move(clauses));
}

// Binds generator i to a single value.
ExprPtr bind_generator(const ExprPtr& expr, size_t i, const ExprPtr& value) {
    const auto& clauses = expr->clauses;
    ExprPtr tail = make_comprehension(
        expr->kind, expr->head(), slice(clauses, i + 1, clauses.size()));
    tail = substitute(tail, clauses[i].var, value);
    std::vector<Clause> result = slice(clauses, 0, i);
    result.insert(result.end(), tail->clauses.begin(), tail->clauses.end());
    return make_comprehension(expr->kind, tail->head(), std::move(result));
}

// Replaces a generator over a comprehension by that comprehension's clauses.
ExprPtr inline_generator(const ExprPtr& expr, size_t i, const ExprPtr& inner) {
    const ExprPtr fresh = freshen(inner);
    const auto& clauses = expr->clauses;
    ExprPtr tail = make_comprehension(
        expr->kind, expr->head(), slice(clauses, i + 1, clauses.size()));
    tail = substitute(tail, clauses[i].var, fresh->head());
    std::vector<Clause> result = slice(clauses, 0, i);
    result.insert(result.end(), fresh->clauses.begin(), fresh->clauses.end());
    result.insert(result.end(), tail->clauses.begin(), tail->clauses.end());
    return make_comprehension(expr->kind, tail->head(), std::move(result));
}

// unique over a + c, beyond uniqueness over each part: no value projected
// from a collides with one projected from c. Requires a single generator.
ExprPtr unique_cross(const ExprPtr& expr, size_t i) {
    const ExprPtr fresh = freshen(expr);
    const auto& clauses = fresh->clauses;
    const std::string x = clauses[i].var;
    const std::string y = fresh_name(x);
    const ExprPtr source = clauses[i].expr;

    ExprPtr tail = make_comprehension(ExprKind::UNIQUE, fresh->head(),
                                      slice(clauses, i + 1, clauses.size()));
    const ExprPtr tail_y = substitute(tail, x, dsl::var(y));

    std::vector<Clause> inner_clauses = {dsl::gen(y, source->args[1])};
    inner_clauses.insert(inner_clauses.end(), tail_y->clauses.begin(),
                         tail_y->clauses.end());
    const ExprPtr inner = dsl::all(dsl::ne(fresh->head(), tail_y->head()),
                                   std::move(inner_clauses));

    std::vector<Clause> outer_clauses = clauses;
    outer_clauses[i].expr = source->args[0];
    return dsl::all(inner, std::move(outer_clauses));
}

ExprPtr split_generator(const ExprPtr& expr, size_t i, Polarity polarity) {
    const ExprPtr& source = expr->clauses[i].expr;
    const ExprKind kind = expr->kind;
    switch (source->kind) {
        case ExprKind::EMPTY_BAG:
            switch (kind) {
                case ExprKind::EXISTS:
                    return dsl::bool_lit(false);
                case ExprKind::COMPREHENSION:
                    return dsl::empty_bag();
                default:
                    return dsl::bool_lit(true);
            }

        case ExprKind::SINGLETON:
            return bind_generator(expr, i, source->args[0]);

        case ExprKind::COMPREHENSION:
            return inline_generator(expr, i, source);

        case ExprKind::BAG_UNION: {
            const ExprPtr lhs = replace_source(expr, i, source->args[0]);
            const ExprPtr rhs = replace_source(expr, i, source->args[1]);
            switch (kind) {
                case ExprKind::ALL:
                    return make_and(lhs, rhs);
                case ExprKind::EXISTS:
                    return make_or(lhs, rhs);
                case ExprKind::COMPREHENSION:
                    return dsl::bag_union(lhs, rhs);
                case ExprKind::UNIQUE:
                    if (count_generators(*expr) != 1) return nullptr;
                    return make_and(make_and(lhs, rhs), unique_cross(expr, i));
                default:
                    return nullptr;
            }
        }

        case ExprKind::BAG_DIFF: {
            if (polarity == Polarity::NEUTRAL) return nullptr;
            const bool positive = (polarity == Polarity::POSITIVE);
            switch (kind) {
                case ExprKind::ALL:
                    return positive ? replace_source(expr, i, source->args[0])
                                    : replace_source_excluding(expr, i);
                case ExprKind::EXISTS:
                    return positive ? replace_source_excluding(expr, i)
                                    : replace_source(expr, i, source->args[0]);
                case ExprKind::UNIQUE:
                    return positive ? replace_source(expr, i, source->args[0])
                                    : dsl::bool_lit(true);
                default:
                    return nullptr;
            }
        }

        default:
            return nullptr;
    }
}

ExprPtr rewrite_quantifier(const ExprPtr& expr, Polarity polarity) {
    Polarity head_polarity = Polarity::NEUTRAL;
    Polarity filter_polarity = Polarity::NEUTRAL;
    switch (expr->kind) {
        case ExprKind::ALL:
            head_polarity = polarity;
            filter_polarity = flip(polarity);
            break;
        case ExprKind::EXISTS:
            filter_polarity = polarity;
            break;
        default:
            break;
    }

    std::vector<Clause> clauses = expr->clauses;
    for (auto& clause : clauses) {
        clause.expr = rewrite(clause.expr, clause.kind == Clause::GENERATOR
                                               ? Polarity::NEUTRAL
                                               : filter_polarity);
    }
    const ExprPtr head = rewrite(expr->head(), head_polarity);
    const ExprPtr rebuilt =
        make_comprehension(expr->kind, head, std::move(clauses));

    for (size_t i = 0; i < rebuilt->clauses.size(); ++i) {
        if (rebuilt->clauses[i].kind != Clause::GENERATOR) continue;
        if (ExprPtr split = split_generator(rebuilt, i, polarity)) {
            return rewrite(split, polarity);
        }
    }
    return rebuilt;
}

ExprPtr rewrite(const ExprPtr& expr, Polarity polarity) {
    switch (expr->kind) {
        case ExprKind::LITERAL:
        case ExprKind::VAR:
        case ExprKind::STATE:
        case ExprKind::EMPTY_BAG:
            return expr;
        case ExprKind::NOT:
            return make_not(rewrite(expr->args[0], flip(polarity)));
        case ExprKind::AND:
            return make_and(rewrite(expr->args[0], polarity),
                            rewrite(expr->args[1], polarity));
        case ExprKind::OR:
            return make_or(rewrite(expr->args[0], polarity),
                           rewrite(expr->args[1], polarity));
        case ExprKind::IMPLIES:
            return make_implies(rewrite(expr->args[0], flip(polarity)),
                                rewrite(expr->args[1], polarity));
        case ExprKind::IN:
            return membership(rewrite(expr->args[0], Polarity::NEUTRAL),
                              rewrite(expr->args[1], Polarity::NEUTRAL),
                              polarity);
        case ExprKind::LEN:
            return cardinality(rewrite(expr->args[0], Polarity::NEUTRAL));
        case ExprKind::SUM:
            return total(rewrite(expr->args[0], Polarity::NEUTRAL));
        case ExprKind::COMPREHENSION:
        case ExprKind::EXISTS:
        case ExprKind::ALL:
        case ExprKind::UNIQUE:
            return rewrite_quantifier(expr, polarity);
        default: {
            std::vector<ExprPtr> args;
            bool changed = false;
            for (const auto& arg : expr->args) {
                args.push_back(rewrite(arg, Polarity::NEUTRAL));
                changed = changed or args.back() != arg;
            }
            return changed ? with_args(expr, std::move(args)) : expr;
        }
    }
}

}  // namespace

ExprPtr rewrite_deltas(const ExprPtr& expr, Polarity polarity) {
    return rewrite(expr, polarity);
}

//----------------------------------------------------------------------------
// Negation normal form

namespace {

std::vector<Clause> nnf_clauses(const std::vector<Clause>& clauses) {
    std::vector<Clause> result = clauses;
    for (auto& clause : result) {
        if (clause.kind == Clause::FILTER) {
            clause.expr = nnf(clause.expr);
        }
    }
    return result;
}

// all [head | clauses[k...]]
ExprPtr nnf_all(const Expr& expr, size_t k, bool negate) {
    const auto& clauses = expr.clauses;
    if (k == clauses.size()) {
        return nnf(expr.head(), negate);
    }
    if (clauses[k].kind == Clause::FILTER) {
        const ExprPtr& cond = clauses[k].expr;
        return negate ? make_and(nnf(cond), nnf_all(expr, k + 1, true))
                      : make_or(nnf(cond, true), nnf_all(expr, k + 1, false));
    }
    std::vector<Clause> rest = nnf_clauses(slice(clauses, k, clauses.size()));
    if (negate) {
        rest.push_back(dsl::filter(nnf(expr.head(), true)));
        return dsl::exists(dsl::bool_lit(true), std::move(rest));
    }
    return dsl::all(nnf(expr.head()), std::move(rest));
}

// exists [_ | clauses[k...]]
ExprPtr nnf_exists(const Expr& expr, size_t k, bool negate) {
    const auto& clauses = expr.clauses;
    if (k == clauses.size()) {
        return dsl::bool_lit(not negate);
    }
    if (clauses[k].kind == Clause::FILTER) {
        const ExprPtr& cond = clauses[k].expr;
        return negate ? make_or(nnf(cond, true), nnf_exists(expr, k + 1, true))
                      : make_and(nnf(cond), nnf_exists(expr, k + 1, false));
    }
    std::vector<Clause> rest = nnf_clauses(slice(clauses, k, clauses.size()));
    if (not negate) {
        return dsl::exists(dsl::bool_lit(true), std::move(rest));
    }
    ExprPtr head = dsl::bool_lit(false);
    if (rest.back().kind == Clause::FILTER) {
        head = nnf(expr.clauses.back().expr, true);
        rest.pop_back();
    }
    return dsl::all(head, std::move(rest));
}

ExprPtr make_atom(ExprKind kind, const ExprPtr& expr) {
    return make_binary(kind, expr->args[0], expr->args[1]);
}

}  // namespace

ExprPtr nnf(const ExprPtr& expr, bool negate) {
    switch (expr->kind) {
        case ExprKind::LITERAL:
            if (expr->literal.kind() == Value::Kind::BOOL) {
                return dsl::bool_lit(expr->literal.as_bool() != negate);
            }
            return expr;
        case ExprKind::NOT:
            return nnf(expr->args[0], not negate);
        case ExprKind::AND:
            return negate ? make_or(nnf(expr->args[0], true),
                                    nnf(expr->args[1], true))
                          : make_and(nnf(expr->args[0]), nnf(expr->args[1]));
        case ExprKind::OR:
            return negate ? make_and(nnf(expr->args[0], true),
                                     nnf(expr->args[1], true))
                          : make_or(nnf(expr->args[0]), nnf(expr->args[1]));
        case ExprKind::IMPLIES:
            return negate ? make_and(nnf(expr->args[0]),
                                     nnf(expr->args[1], true))
                          : make_or(nnf(expr->args[0], true),
                                    nnf(expr->args[1]));
        case ExprKind::EQ:
            return negate ? make_atom(ExprKind::NE, expr) : expr;
        case ExprKind::NE:
            return negate ? make_atom(ExprKind::EQ, expr) : expr;
        case ExprKind::LT:
            return negate ? make_atom(ExprKind::GE, expr) : expr;
        case ExprKind::LE:
            return negate ? make_atom(ExprKind::GT, expr) : expr;
        case ExprKind::GT:
            return negate ? make_atom(ExprKind::LE, expr) : expr;
        case ExprKind::GE:
            return negate ? make_atom(ExprKind::LT, expr) : expr;
        case ExprKind::ALL:
            return nnf_all(*expr, 0, negate);
        case ExprKind::EXISTS:
            return nnf_exists(*expr, 0, negate);
        case ExprKind::UNIQUE:
            if (count_generators(*expr) == 0) {
                return dsl::bool_lit(not negate);
            }
            return negate ? dsl::not_(expr) : expr;
        default:
            return negate ? dsl::not_(expr) : expr;
    }
}

void split_conjuncts(const ExprPtr& expr, std::vector<ExprPtr>& conjuncts) {
    if (expr->kind == ExprKind::AND) {
        split_conjuncts(expr->args[0], conjuncts);
        split_conjuncts(expr->args[1], conjuncts);
    } else if (not is_true(expr)) {
        conjuncts.push_back(expr);
    }
}

}  // namespace invar
