#pragma once

#define CONDUIT_VERSION "1.0.0"
