#pragma once

#include <string>
#include <utility>

namespace mpos {

// Visual root an activity builds in OnCreate. Rendering is someone else's
// job: the navigator only hands surfaces to the SurfaceHost and releases them
// when their activity is destroyed. Display toolkits subclass this to carry
// their own widget tree.
class Surface {
 public:
  explicit Surface(std::string name) : name_(std::move(name)) {
  }
  virtual ~Surface() = default;

  Surface(const Surface&) = delete;
  Surface& operator=(const Surface&) = delete;
  Surface(Surface&&) = delete;
  Surface& operator=(Surface&&) = delete;

  [[nodiscard]] auto Name() const -> const std::string& {
    return name_;
  }

 private:
  std::string name_;
};

// Display side of the navigator. Present is called when an activity comes to
// the foreground, Release right after its OnDestroy.
class SurfaceHost {
 public:
  virtual ~SurfaceHost() = default;
  virtual void Present(Surface& surface, bool animate) = 0;
  virtual void Release(Surface& surface) = 0;
};

}  // namespace mpos
