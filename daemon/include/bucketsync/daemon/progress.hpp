#pragma once

#include <ostream>
#include <string>

#include "bucketsync/blob_store.hpp"

namespace bucketsync::daemon
{

    // Returns a callback printing "\r<verb> <name>: <done> / <total> bytes" to
    // out whenever the completed percentage changes. Output from both loops is
    // serialized on a process-wide mutex.
    ProgressCallback console_progress(std::ostream &out, std::string verb, std::string name);

} // namespace bucketsync::daemon
