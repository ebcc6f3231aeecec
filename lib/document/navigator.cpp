// json_model/document/navigator.cpp - Key path navigation implementation
#include "json_model/document/navigator.hpp"

#include <utility>

namespace json_model
{

namespace
{

StructuralError not_an_object(const KeyPath & path, size_t walked, const nlohmann::json & node)
{
  StructuralError err;
  err.path_so_far = path.prefix_string(walked);
  err.reason = std::string("expected an object but found ") + node.type_name();
  return err;
}

}  // namespace

Result<const nlohmann::json *, StructuralError> read_at_path(
  const nlohmann::json & root, const KeyPath & path)
{
  using ReadResult = Result<const nlohmann::json *, StructuralError>;

  const nlohmann::json * current = &root;
  for (size_t i = 0; i < path.size(); ++i) {
    if (!current->is_object()) {
      return ReadResult::fail(not_an_object(path, i, *current));
    }

    const auto it = current->find(path[i]);
    if (it == current->end()) {
      return ReadResult::ok(nullptr);
    }

    current = &*it;
    if (current->is_null()) {
      // Explicit null: stop here and hand the null back to the caller.
      return ReadResult::ok(current);
    }
  }

  return ReadResult::ok(current);
}

Status<StructuralError> write_at_path(
  nlohmann::json & root, const KeyPath & path, nlohmann::json value, WriteMode mode)
{
  using WriteResult = Status<StructuralError>;

  // Validate the prefix first so a failed write leaves `root` untouched.
  const nlohmann::json * existing = &root;
  for (size_t i = 0; i < path.size(); ++i) {
    if (existing->is_null() && i == 0) {
      break;  // empty root, becomes an object below
    }
    if (!existing->is_object()) {
      return WriteResult::fail(not_an_object(path, i, *existing));
    }
    const auto it = existing->find(path[i]);
    if (it == existing->end()) {
      break;  // everything below is created fresh
    }
    if (i + 1 == path.size()) {
      if (mode == WriteMode::FailIfPresent) {
        StructuralError err;
        err.path_so_far = path.to_string();
        err.reason = std::string("found an existing ") + it->type_name() + " value";
        return WriteResult::fail(std::move(err));
      }
      break;
    }
    existing = &*it;
  }

  if (root.is_null()) {
    root = nlohmann::json::object();
  }

  nlohmann::json * current = &root;
  for (size_t i = 0; i + 1 < path.size(); ++i) {
    auto it = current->find(path[i]);
    if (it == current->end()) {
      it = current->emplace(path[i], nlohmann::json::object()).first;
    }
    current = &*it;
  }

  (*current)[path.back()] = std::move(value);
  return WriteResult::ok({});
}

}  // namespace json_model
