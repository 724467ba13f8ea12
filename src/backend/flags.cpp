#include <gflags/gflags.h>

DEFINE_string(backend_address, "", "Default cluster address for backend::init (empty starts a local cluster)");
DEFINE_int32(backend_num_cpus, 0, "Default CPU slots for a locally started cluster (0 uses hardware concurrency)");
