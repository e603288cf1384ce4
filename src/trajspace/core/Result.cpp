#include "core/Result.hpp"

namespace TS {

Result::Result(std::map<std::string, Value> fields)
    : fields(std::move(fields)) {}

auto Result::set(std::string const& name, Value value) -> Expected<void> {
    if (this->locked)
        return std::unexpected(Error{Error::Code::ParameterLocked, "Result " + this->ownerName + " is locked"});
    if (name.empty())
        return std::unexpected(Error{Error::Code::InvalidArgument, "Result fields need a name"});
    this->fields[name] = std::move(value);
    return {};
}

auto Result::get(std::string const& name) const -> Expected<Value> {
    auto it = this->fields.find(name);
    if (it == this->fields.end())
        return std::unexpected(Error{Error::Code::NoSuchPath, "Result " + this->ownerName + " has no field " + name});
    return it->second;
}

auto Result::store() const -> Value {
    Value representation = Value::object();
    for (auto const& [name, value] : this->fields)
        representation[name] = value;
    return representation;
}

auto Result::load(Value const& representation) -> Expected<void> {
    if (!representation.is_object())
        return std::unexpected(Error{Error::Code::MalformedInput, "Result payload of " + this->ownerName + " is not an object"});
    for (auto const& [name, value] : representation.items())
        this->fields[name] = value;
    return {};
}

auto Result::toDict() const -> Value {
    return this->store();
}

auto Result::fieldNames() const -> std::vector<std::string> {
    std::vector<std::string> names;
    names.reserve(this->fields.size());
    for (auto const& [name, value] : this->fields)
        names.push_back(name);
    return names;
}

auto Result::removeFields(std::span<std::string const> names) -> Expected<void> {
    if (this->locked)
        return std::unexpected(Error{Error::Code::ParameterLocked, "Result " + this->ownerName + " is locked"});
    for (auto const& name : names)
        this->fields.erase(name);
    return {};
}

auto Result::clone() const -> std::unique_ptr<Item> {
    return std::make_unique<Result>(*this);
}

} // namespace TS
