#pragma once

/// @file tether.h
/// Umbrella header: include this to get the full tether C++ API.

#include "error.h"
#include "types.h"
#include "assuan.h"
#include "ssh_keys.h"
#include "pinentry.h"
#include "ui.h"
#include "credentials.h"
#include "progress.h"
#include "report.h"
#include "paths.h"
#include "backend.h"
#include "remote.h"
