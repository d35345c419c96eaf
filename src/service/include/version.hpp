#pragma once

#ifndef ESPANSO_VERSION
#define ESPANSO_VERSION "2.0.0"
#endif
