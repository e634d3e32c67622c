#include "poz/core/action.hpp"

namespace poz::core {

namespace {

template <class... Ts>
struct Overloaded : Ts... {
  using Ts::operator()...;
};

}  // namespace

bool requiresBody(const Action& action) {
  return std::holds_alternative<CreateNote>(action) ||
         std::holds_alternative<PostFromClipboard>(action) ||
         std::holds_alternative<Update>(action) ||
         std::holds_alternative<Burn>(action);
}

bool isAdvanced(const Action& action) {
  return std::holds_alternative<ListLast>(action) ||
         std::holds_alternative<Search>(action) ||
         std::holds_alternative<Update>(action) ||
         std::holds_alternative<Delete>(action);
}

bool createsNote(const Action& action) {
  return std::holds_alternative<CreateNote>(action) ||
         std::holds_alternative<PostFromClipboard>(action) ||
         std::holds_alternative<Burn>(action);
}

std::string_view actionName(const Action& action) {
  return std::visit(Overloaded{
      [](const CreateNote&) -> std::string_view { return "create"; },
      [](const PostFromClipboard&) -> std::string_view { return "post-from-clipboard"; },
      [](const ListLast&) -> std::string_view { return "list-last"; },
      [](const Search&) -> std::string_view { return "search"; },
      [](const Update&) -> std::string_view { return "update"; },
      [](const Delete&) -> std::string_view { return "delete"; },
      [](const Burn&) -> std::string_view { return "burn"; },
  }, action);
}

}  // namespace poz::core
