#include <blobpack/tags.hpp>

#include <array>
#include <utility>

namespace blobpack {

namespace {

constexpr std::array<std::pair<Tag, const char*>, 8> kTagNames = {{
    {Tag::kDone, "done"},
    {Tag::kReserved, "reserved"},
    {Tag::kInProgress, "in_progress"},
    {Tag::kComplete, "complete"},
    {Tag::kWillDelete, "will_delete"},
    {Tag::kReadyDelete, "ready_delete"},
    {Tag::kDeleteComplete, "delete_complete"},
    {Tag::kRecoverInProgress, "recover_in_progress"},
}};

}  // namespace

const char* TagName(Tag tag) {
  for (const auto& [t, name] : kTagNames) {
    if (t == tag) return name;
  }
  return "unknown";
}

bool ParseTag(std::string_view name, Tag* out) {
  if (!out) return false;
  for (const auto& [t, tag_name] : kTagNames) {
    if (name == tag_name) {
      *out = t;
      return true;
    }
  }
  return false;
}

}  // namespace blobpack
