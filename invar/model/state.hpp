#pragma once

#include <invar/model/value.hpp>
#include <map>
#include <string>

namespace invar {

// A mapping from state variable to bag. Copying a State is cheap: bags share
// their immutable storage, so a copy is a consistent snapshot.
class State {
   public:
    typedef std::map<std::string, Bag> Bags;

    bool has(const std::string& name) const {
        return bags_.find(name) != bags_.end();
    }
    const Bag* find(const std::string& name) const {
        auto i = bags_.find(name);
        return i == bags_.end() ? nullptr : &i->second;
    }
    const Bag& get(const std::string& name) const {
        return map_find(bags_, name);
    }
    void set(const std::string& name, const Bag& bag) { bags_[name] = bag; }

    const Bags& bags() const { return bags_; }

    bool operator==(const State& other) const { return bags_ == other.bags_; }
    bool operator!=(const State& other) const { return not operator==(other); }

   private:
    Bags bags_;
};

inline std::ostream& operator<<(std::ostream& os, const State& state) {
    os << "{";
    bool first = true;
    for (const auto& pair : state.bags()) {
        if (not first) os << ", ";
        first = false;
        os << pair.first << " = " << pair.second;
    }
    return os << "}";
}

}  // namespace invar
