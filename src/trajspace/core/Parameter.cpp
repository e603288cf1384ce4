#include "core/Parameter.hpp"

#include "log/TaggedLogger.hpp"

#include <algorithm>

namespace TS {

namespace {

auto sameCategory(Value const& lhs, Value const& rhs) -> bool {
    if (lhs.is_number() && rhs.is_number())
        return true;
    return lhs.type() == rhs.type();
}

} // namespace

Parameter::Parameter(Value value)
    : data(std::move(value)) {}

auto Parameter::size() const -> std::size_t {
    if (!this->range.empty())
        return this->range.size();
    return this->data ? 1 : 0;
}

auto Parameter::checkSameType(Value const& value) const -> Expected<void> {
    if (this->data && !sameCategory(*this->data, value)) {
        return std::unexpected(Error{Error::Code::TypeMismatch,
                                     "Parameter " + this->ownerName + " expects values of type " + this->data->type_name()
                                             + " but got " + value.type_name()});
    }
    return {};
}

auto Parameter::set(Value value) -> Expected<void> {
    if (this->locked)
        return std::unexpected(Error{Error::Code::ParameterLocked, "Parameter " + this->ownerName + " is locked"});
    if (value.is_null())
        return std::unexpected(Error{Error::Code::InvalidArgument, "Parameter " + this->ownerName + " cannot hold null"});
    if (this->isArray()) {
        if (auto check = this->checkSameType(value); !check)
            return check;
    }
    this->data = std::move(value);
    return {};
}

auto Parameter::get() const -> Expected<Value> {
    if (!this->data)
        return std::unexpected(Error{Error::Code::NoSuchPath, "Parameter " + this->ownerName + " is empty"});
    return *this->data;
}

auto Parameter::access(std::size_t n) const -> Expected<Value> {
    if (this->isArray()) {
        if (n >= this->range.size()) {
            return std::unexpected(Error{Error::Code::OutOfRange,
                                         "Cannot access entry " + std::to_string(n) + " of " + this->ownerName + ", it only has "
                                                 + std::to_string(this->range.size()) + " entries"});
        }
        return this->range[n];
    }
    if (n != 0 || !this->data) {
        return std::unexpected(Error{Error::Code::OutOfRange,
                                     "Cannot access entry " + std::to_string(n) + " of " + this->ownerName + ", it has "
                                             + std::to_string(this->size()) + " entries"});
    }
    return *this->data;
}

auto Parameter::valueForRun(std::optional<std::size_t> run) const -> Expected<Value> {
    if (run && this->isArray())
        return this->access(*run);
    return this->get();
}

auto Parameter::explore(std::vector<Value> values) -> Expected<void> {
    if (values.empty())
        return std::unexpected(Error{Error::Code::InvalidArgument, "Cannot explore " + this->ownerName + " with an empty list"});
    Value const& reference = this->data ? *this->data : values.front();
    for (auto const& value : values) {
        if (!sameCategory(reference, value)) {
            return std::unexpected(Error{Error::Code::TypeMismatch,
                                         "Explored values of " + this->ownerName + " must share the type " + reference.type_name()});
        }
    }
    if (!this->data)
        this->data = values.front();
    this->range = std::move(values);
    ts_log("Parameter::explore " + this->ownerName + " length=" + std::to_string(this->range.size()), "Exploration");
    return {};
}

auto Parameter::addItems(std::vector<Value> const& values) -> Expected<void> {
    if (this->locked)
        return std::unexpected(Error{Error::Code::ParameterLocked, "Parameter " + this->ownerName + " is locked"});
    if (!this->isArray())
        return std::unexpected(Error{Error::Code::ParameterNotArray, "Parameter " + this->ownerName + " is not an array"});
    for (auto const& value : values) {
        if (auto check = this->checkSameType(value); !check)
            return check;
    }
    this->range.insert(this->range.end(), values.begin(), values.end());
    return {};
}

auto Parameter::changeValuesInArray(std::vector<Value> const& values, std::vector<std::size_t> const& positions) -> Expected<void> {
    if (!this->isArray())
        return std::unexpected(Error{Error::Code::ParameterNotArray, "Parameter " + this->ownerName + " is not an array"});
    if (this->locked)
        return std::unexpected(Error{Error::Code::ParameterLocked, "Parameter " + this->ownerName + " is locked"});
    if (values.size() != positions.size()) {
        return std::unexpected(Error{Error::Code::LengthMismatch,
                                     "Got " + std::to_string(values.size()) + " values for " + std::to_string(positions.size())
                                             + " positions"});
    }
    for (std::size_t i = 0; i < values.size(); ++i) {
        if (positions[i] >= this->range.size()) {
            return std::unexpected(Error{Error::Code::OutOfRange,
                                         "Parameter " + this->ownerName + " has no entry " + std::to_string(positions[i])});
        }
        if (auto check = this->checkSameType(values[i]); !check)
            return check;
    }
    for (std::size_t i = 0; i < values.size(); ++i)
        this->range[positions[i]] = values[i];
    return {};
}

auto Parameter::shrink() -> Expected<void> {
    if (this->locked)
        return std::unexpected(Error{Error::Code::ParameterLocked, "Parameter " + this->ownerName + " is locked"});
    this->range.clear();
    return {};
}

auto Parameter::store() const -> Value {
    Value representation = Value::object();
    if (this->data)
        representation[std::string(DataField)] = *this->data;
    if (!this->range.empty())
        representation[std::string(ExploredField)] = this->range;
    return representation;
}

auto Parameter::load(Value const& representation) -> Expected<void> {
    if (!representation.is_object())
        return std::unexpected(Error{Error::Code::MalformedInput, "Parameter payload of " + this->ownerName + " is not an object"});
    if (auto it = representation.find(std::string(DataField)); it != representation.end())
        this->data = *it;
    if (auto it = representation.find(std::string(ExploredField)); it != representation.end()) {
        if (!it->is_array())
            return std::unexpected(Error{Error::Code::MalformedInput, "Explored data of " + this->ownerName + " is not an array"});
        this->range = it->get<std::vector<Value>>();
    }
    return {};
}

auto Parameter::toDict() const -> Value {
    return this->store();
}

auto Parameter::fieldNames() const -> std::vector<std::string> {
    std::vector<std::string> names;
    if (this->data)
        names.emplace_back(DataField);
    if (!this->range.empty())
        names.emplace_back(ExploredField);
    return names;
}

auto Parameter::removeFields(std::span<std::string const> fields) -> Expected<void> {
    if (this->locked)
        return std::unexpected(Error{Error::Code::ParameterLocked, "Parameter " + this->ownerName + " is locked"});
    for (auto const& field : fields) {
        if (field == DataField)
            this->data.reset();
        else if (field == ExploredField)
            this->range.clear();
    }
    return {};
}

auto Parameter::isEmpty() const -> bool {
    return !this->data && this->range.empty();
}

auto Parameter::clear() -> void {
    this->data.reset();
    this->range.clear();
}

auto Parameter::clone() const -> std::unique_ptr<Item> {
    return std::make_unique<Parameter>(*this);
}

} // namespace TS
