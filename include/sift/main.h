#pragma once

//   main.h
//
//   General include file for all programs and modules that use Sift.

#include <sift/system/types.h>
#include <sift/system/errors.h>
#include <sift/modules/core.h>
