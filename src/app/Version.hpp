#pragma once

// Set by the build from the project version
#ifndef NBSTRIPOUT_VERSION_STRING
#define NBSTRIPOUT_VERSION_STRING "0.8.1"
#endif
