#include "spymon/core/sample_source.hpp"
#include "spymon/core/errors.hpp"

#if SPYMON_HAS_PROCFS
  #include "spymon/backends/procfs/proc_sample_source.hpp"
#endif

namespace spymon {
    std::unique_ptr<ISampleSource> createSampleSource(const int pid, const Config& config) {
#if SPYMON_HAS_PROCFS
        return std::make_unique<procfs::ProcSampleSource>(pid, config);
#else
        (void)config;
        throw Error(ErrorCode::AttachFailure,
                    "Cannot attach to process " + std::to_string(pid) + ": no sample source for this platform");
#endif
    }
}
