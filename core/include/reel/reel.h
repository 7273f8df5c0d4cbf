#pragma once

/**
 * @file reel.h
 * @brief Main header for the reel animation engine
 *
 * Include this to pull in the whole engine: easing, springs, interpolation,
 * sequencing, transforms, wheels, transitions, scenes and compositions.
 */

#include <reel/types.h>
#include <reel/context.h>
#include <reel/easing.h>
#include <reel/spring.h>
#include <reel/interpolate.h>
#include <reel/sequence.h>
#include <reel/transform.h>
#include <reel/wheel.h>
#include <reel/transition.h>
#include <reel/scene.h>
#include <reel/cue.h>
#include <reel/param.h>
#include <reel/element_state.h>
#include <reel/element.h>
#include <reel/composition.h>
#include <reel/config.h>
