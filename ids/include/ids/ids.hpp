#pragma once

#include <ids/id.hpp>

DEFINE_ID_TYPE(SessionId)
DEFINE_ID_TYPE(TabId)
DEFINE_ID_TYPE(TaskId)
DEFINE_ID_TYPE(ProcessId)
DEFINE_ID_TYPE(SubscriptionId)
DEFINE_ID_TYPE(GuardianId)
