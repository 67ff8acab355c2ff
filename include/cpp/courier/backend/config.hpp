#pragma once

#include <filesystem>

namespace courier::backend
{
  /* Handed to every backend operation untouched. The engine itself only reads
   * `upload_dir`, to find where an upload landed on local disk. */
  struct config
  {
    std::filesystem::path upload_dir{ "uploads" };
    std::filesystem::path workspace_dir{ "workspace" };
    /* Seconds; vm_execute falls back to it when no timeout is given. Zero or less
     * leaves the choice to the backend. */
    int vm_timeout{ 30 };
  };
}
