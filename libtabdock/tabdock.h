#pragma once

#include <libtabdock/Dock/CloseNegotiation.h>
#include <libtabdock/Dock/DockArea.h>
#include <libtabdock/Dock/DockAreaOptions.h>
#include <libtabdock/Dock/DockState.h>
#include <libtabdock/Dock/DockStyle.h>
#include <libtabdock/Dock/DrawContext.h>
#include <libtabdock/Dock/Node.h>
#include <libtabdock/Dock/NodeIndex.h>
#include <libtabdock/Dock/OnCloseResponse.h>
#include <libtabdock/Dock/ScrollBars.h>
#include <libtabdock/Dock/Surface.h>
#include <libtabdock/Dock/SurfaceIndex.h>
#include <libtabdock/Dock/TabBodyFlags.h>
#include <libtabdock/Dock/TabButtonResponse.h>
#include <libtabdock/Dock/TabId.h>
#include <libtabdock/Dock/TabIndex.h>
#include <libtabdock/Dock/TabPath.h>
#include <libtabdock/Dock/TabStyle.h>
#include <libtabdock/Dock/TabViewer.h>
#include <libtabdock/Graphics/Color.h>
#include <libtabdock/Maths/Rect.h>
#include <libtabdock/Maths/Vec2.h>
#include <libtabdock/Platform/DockConfig.h>
#include <libtabdock/Platform/Log.h>
#include <libtabdock/Platform/LogLevel.h>
#include <libtabdock/Platform/Logger.h>
#include <libtabdock/UI/tabdockimgui.h>
#include <libtabdock/Utils/Assertions.h>
#include <libtabdock/Utils/CStringView.h>
#include <libtabdock/Utils/Flags.h>
#include <libtabdock/Utils/StrongIndex.h>
