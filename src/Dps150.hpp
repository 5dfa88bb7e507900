// -----------------------------------------------------------------------------------------------
// -----------------------------------------------------------------------------------------------

#ifndef __DPS150_HPP__
#define __DPS150_HPP__

#include "Debug.hpp"
#include "Errors.hpp"
#include "Utilities.hpp"
#include "UtilitiesJson.hpp"

#include "protocol/ProtocolConstants.hpp"
#include "protocol/ProtocolFrame.hpp"
#include "protocol/ProtocolScanner.hpp"
#include "protocol/ProtocolFields.hpp"

#include "device/DeviceSnapshot.hpp"
#include "device/DeviceTransport.hpp"
#include "device/DeviceSession.hpp"

#include "Logging.hpp"
#include "Config.hpp"

#endif

// -----------------------------------------------------------------------------------------------
// -----------------------------------------------------------------------------------------------
