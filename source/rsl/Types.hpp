#pragma once

#include <oishii/types.hxx>
