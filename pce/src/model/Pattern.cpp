#include "model/Pattern.h"
#include <algorithm>

namespace PCE {

namespace {

PatternPtr makePattern(Pattern pattern) {
    return std::make_shared<Pattern>(std::move(pattern));
}

void collectNames(const Pattern &pattern, std::vector<std::string> &out) {
    auto add = [&out](const std::string &name) {
        if (name != "_" && std::find(out.begin(), out.end(), name) == out.end()) {
            out.push_back(name);
        }
    };

    switch (pattern.kind) {
    case PatternKind::BIND:
        add(pattern.name);
        break;
    case PatternKind::COLLECTION:
        for (const auto &element : pattern.elements) {
            collectNames(*element, out);
        }
        for (const auto &[key, value] : pattern.entries) {
            collectNames(*key, out);
            collectNames(*value, out);
        }
        if (pattern.remainder) {
            add(*pattern.remainder);
        }
        break;
    case PatternKind::CONJUNCTION:
        for (const auto &element : pattern.elements) {
            collectNames(*element, out);
        }
        break;
    default:
        break;
    }
}

std::string joinPatterns(const std::vector<PatternPtr> &patterns) {
    std::string out;
    for (size_t i = 0; i < patterns.size(); ++i) {
        if (i > 0) {
            out += ", ";
        }
        out += patterns[i]->describe();
    }
    return out;
}

std::string remainderSuffix(const Pattern &pattern) {
    if (!pattern.remainder) {
        return "";
    }
    return (pattern.elements.empty() && pattern.entries.empty() ? "..." : " ...") + *pattern.remainder;
}

}  // namespace

PatternPtr Pattern::wildcard() {
    static const PatternPtr instance = makePattern(Pattern{});
    return instance;
}

PatternPtr Pattern::bind(const std::string &name) {
    if (name == "_") {
        return wildcard();
    }
    Pattern p;
    p.kind = PatternKind::BIND;
    p.name = name;
    return makePattern(std::move(p));
}

PatternPtr Pattern::literalValue(const Value &value) {
    Pattern p;
    p.kind = PatternKind::LITERAL;
    p.literal = value;
    return makePattern(std::move(p));
}

PatternPtr Pattern::list(std::vector<PatternPtr> elements, std::optional<std::string> remainder) {
    Pattern p;
    p.kind = PatternKind::COLLECTION;
    p.collection = CollectionKind::LIST;
    p.elements = std::move(elements);
    p.remainder = std::move(remainder);
    return makePattern(std::move(p));
}

PatternPtr Pattern::tuple(std::vector<PatternPtr> elements) {
    Pattern p;
    p.kind = PatternKind::COLLECTION;
    p.collection = CollectionKind::TUPLE;
    p.elements = std::move(elements);
    return makePattern(std::move(p));
}

PatternPtr Pattern::set(std::vector<PatternPtr> elements, std::optional<std::string> remainder) {
    Pattern p;
    p.kind = PatternKind::COLLECTION;
    p.collection = CollectionKind::SET;
    p.elements = std::move(elements);
    p.remainder = std::move(remainder);
    return makePattern(std::move(p));
}

PatternPtr Pattern::map(std::vector<std::pair<PatternPtr, PatternPtr>> entries,
                        std::optional<std::string> remainder) {
    Pattern p;
    p.kind = PatternKind::COLLECTION;
    p.collection = CollectionKind::MAP;
    p.entries = std::move(entries);
    p.remainder = std::move(remainder);
    return makePattern(std::move(p));
}

PatternPtr Pattern::conjunction(PatternPtr left, PatternPtr right) {
    Pattern p;
    p.kind = PatternKind::CONJUNCTION;
    p.elements = {std::move(left), std::move(right)};
    return makePattern(std::move(p));
}

PatternPtr Pattern::disjunction(PatternPtr left, PatternPtr right) {
    Pattern p;
    p.kind = PatternKind::DISJUNCTION;
    p.elements = {std::move(left), std::move(right)};
    return makePattern(std::move(p));
}

PatternPtr Pattern::negation(PatternPtr operand) {
    Pattern p;
    p.kind = PatternKind::NEGATION;
    p.elements = {std::move(operand)};
    return makePattern(std::move(p));
}

PatternPtr Pattern::varRef(const std::string &name) {
    Pattern p;
    p.kind = PatternKind::VAR_REF;
    p.name = name;
    return makePattern(std::move(p));
}

PatternPtr Pattern::typed(SimpleType type) {
    Pattern p;
    p.kind = PatternKind::TYPE;
    p.simpleType = type;
    return makePattern(std::move(p));
}

std::vector<std::string> Pattern::boundNames() const {
    std::vector<std::string> names;
    collectNames(*this, names);
    return names;
}

std::string Pattern::describe() const {
    switch (kind) {
    case PatternKind::WILDCARD:
        return "_";
    case PatternKind::BIND:
        return name;
    case PatternKind::LITERAL:
        return ValueUtils::toString(literal);
    case PatternKind::COLLECTION:
        switch (collection) {
        case CollectionKind::LIST:
            return "[" + joinPatterns(elements) + remainderSuffix(*this) + "]";
        case CollectionKind::TUPLE:
            return "(" + joinPatterns(elements) + (elements.size() == 1 ? ",)" : ")");
        case CollectionKind::SET:
            return "Set(" + joinPatterns(elements) + remainderSuffix(*this) + ")";
        case CollectionKind::MAP: {
            std::string out = "{";
            for (size_t i = 0; i < entries.size(); ++i) {
                if (i > 0) {
                    out += ", ";
                }
                out += entries[i].first->describe() + ": " + entries[i].second->describe();
            }
            return out + remainderSuffix(*this) + "}";
        }
        }
        break;
    case PatternKind::CONJUNCTION:
        return elements[0]->describe() + " /\\ " + elements[1]->describe();
    case PatternKind::DISJUNCTION:
        return elements[0]->describe() + " \\/ " + elements[1]->describe();
    case PatternKind::NEGATION:
        return "~" + elements[0]->describe();
    case PatternKind::VAR_REF:
        return "=" + name;
    case PatternKind::TYPE:
        switch (simpleType) {
        case SimpleType::BOOL:
            return "Bool";
        case SimpleType::INT:
            return "Int";
        case SimpleType::STRING:
            return "String";
        case SimpleType::NAME:
            return "Name";
        }
        break;
    }
    return "?";
}

std::string describePatterns(const std::vector<PatternPtr> &patterns) {
    return "(" + joinPatterns(patterns) + ")";
}

}  // namespace PCE
