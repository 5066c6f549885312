#pragma once

#include <compgroup/types.hpp>
#include <compgroup/base/errors.hpp>
#include <compgroup/world.hpp>
#include <compgroup/join.hpp>
#include <compgroup/schema/classify.hpp>
#include <compgroup/schema/field.hpp>
#include <compgroup/schema/group_schema.hpp>
#include <compgroup/group.hpp>
