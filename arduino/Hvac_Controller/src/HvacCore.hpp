#ifndef __HVAC_CORE_HPP__
#define __HVAC_CORE_HPP__

// -----------------------------------------------------------------------------------------------
// -----------------------------------------------------------------------------------------------

#include "utilities/Debug.hpp"
#include "utilities/Utilities.hpp"
#include "utilities/UtilitiesJson.hpp"

// -----------------------------------------------------------------------------------------------

#include "abcd/AbcdFrame.hpp"
#include "abcd/AbcdTransport.hpp"
#include "abcd/AbcdDevice.hpp"
#include "abcd/AbcdConnection.hpp"

// -----------------------------------------------------------------------------------------------

#include "program/ProgramComponents.hpp"
#include "schedule/Schedule.hpp"
#include "schedule/ScheduleJson.hpp"
#include "hvac/SetpointWriter.hpp"
#include "schedule/ScheduleRunner.hpp"
#include "program/ProgramManageHvac.hpp"

// -----------------------------------------------------------------------------------------------
// -----------------------------------------------------------------------------------------------

#endif
