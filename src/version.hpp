#pragma once

#define CONDUCTOR_VERSION "1.2.0"
