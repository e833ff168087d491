#pragma once

#include "pycomp/capture.hpp"
#include "pycomp/command.hpp"
#include "pycomp/compiler.hpp"
#include "pycomp/component.hpp"
#include "pycomp/config.hpp"
#include "pycomp/data_passing.hpp"
#include "pycomp/errors.hpp"
#include "pycomp/format.hpp"
#include "pycomp/python.hpp"
#include "pycomp/settings.hpp"
#include "pycomp/shim.hpp"
#include "pycomp/signature.hpp"
#include "pycomp/utils.hpp"
