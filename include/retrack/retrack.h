#pragma once

#include <retrack/computed.h>
#include <retrack/containers.h>
#include <retrack/effect.h>
#include <retrack/error.h>
#include <retrack/log.h>
#include <retrack/reactive.h>
#include <retrack/runtime.h>
#include <retrack/traverse.h>
#include <retrack/value.h>
#include <retrack/watch.h>
