//
// Created by usr on 27/10/2025.
//

#pragma once
#include <json11.hpp>

using WJson = json11::Json;

// Json consts
#define wJC static constexpr char const*

wJC JSON_KEY_PODS = "pods";
wJC JSON_KEY_POLICIES = "policies";
wJC JSON_KEY_NAME = "name";
wJC JSON_KEY_NAMESPACE = "namespace";
wJC JSON_KEY_LABELS = "labels";
wJC JSON_KEY_PHASE = "phase";
wJC JSON_KEY_POD_IP = "podIP";
wJC JSON_KEY_HOST_IP = "hostIP";
wJC JSON_KEY_TARGET_PODS = "targetPods";
wJC JSON_KEY_RULES = "rules";
