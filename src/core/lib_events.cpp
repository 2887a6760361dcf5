/*********************************************************************************************************************

-CATEGORY-
Name: Events
-END-

Events are broadcast synchronously: BroadcastEvent() calls every subscriber of the event before it returns.
Subscribers may subscribe or unsubscribe from within their callback.

*********************************************************************************************************************/

#include <array>
#include <new>

#include "defs.h"

namespace sift {

static const std::array<CSTRING, int(EVENT::END)> glEventNames = {
   nullptr,
   "low_memory"
};

struct eventsub {
   struct eventsub *Next, *Prev;
   EVENT    Event;
   EVENT_CALLBACK Callback;
   uint8_t  Called;

   inline CSTRING eventName() {
      return glEventNames[int(Event)];
   }
};

static struct eventsub *glEventList = nullptr;
static uint8_t glCallSignal = 0;
static bool glEventListAltered = false;

//********************************************************************************************************************

int count_subscribers(void)
{
   std::lock_guard lock(glmEvents);
   int total = 0;
   for (auto event = glEventList; event; event = event->Next) total++;
   return total;
}

/*********************************************************************************************************************

-FUNCTION-
BroadcastEvent: Broadcast an event to all event listeners.

Use BroadcastEvent() to call every listener that has subscribed to `Event`.  The listeners are called on the
thread of the caller before BroadcastEvent() returns.

A host application that receives memory pressure notifications from its environment should respond by broadcasting
`EVENT::LOW_MEMORY`.  All lazily populated result caches will be cleared in response.

-INPUT-
int(EVENT) Event: The event to broadcast.

-ERRORS-
Okay
Args

*********************************************************************************************************************/

ERR BroadcastEvent(EVENT Event)
{
   Log log(__FUNCTION__);

   if ((int(Event) < 1) or (int(Event) >= int(EVENT::END))) return log.warning(ERR::Args);

   std::lock_guard lock(glmEvents);

   log.msg(VLF::DETAIL|VLF::BRANCH, "Event %s", glEventNames[int(Event)]);

   struct eventsub *event;
   glCallSignal++;
restart:
   event = glEventList;
   while (event) {
      if (event->Called IS glCallSignal);
      else if (event->Event IS Event) {
         log.trace("Found listener %p for this event.", event);

         event->Called = glCallSignal;

         glEventListAltered = false;

         event->Callback(Event);

         if (glEventListAltered) goto restart;
      }

      event = event->Next;
   }

   return ERR::Okay;
}

/*********************************************************************************************************************

-FUNCTION-
SubscribeEvent: Subscribe to a system event.

Use the SubscribeEvent() function to listen for system events.  The `Callback` will be called each time that the
event is broadcast.

An event handle will be returned in the `Handle` parameter to identify the subscription.  This must be retained to
later unsubscribe from the event with the ~UnsubscribeEvent() function.

-INPUT-
int(EVENT) Event: An event identifier.
func Callback: The function that will be subscribed to the event.
&ptr Handle: Pointer to an address that will receive the event handle.

-ERRORS-
Okay
NullArgs
Args
AllocMemory

*********************************************************************************************************************/

ERR SubscribeEvent(EVENT Event, EVENT_CALLBACK Callback, APTR *Handle)
{
   Log log(__FUNCTION__);

   if ((not Callback) or (not Handle)) return ERR::NullArgs;

   if ((int(Event) < 1) or (int(Event) >= int(EVENT::END))) return log.warning(ERR::Args);

   if (auto event = new (std::nothrow) eventsub) {
      std::lock_guard lock(glmEvents);

      event->Event    = Event;
      event->Callback = std::move(Callback);
      event->Called   = glCallSignal;
      event->Next     = glEventList;
      event->Prev     = nullptr;

      if (glEventList) glEventList->Prev = event;
      glEventList = event;

      log.trace("Handle: %p, %s", event, event->eventName());

      *Handle = event;
      return ERR::Okay;
   }
   else return ERR::AllocMemory;
}

/*********************************************************************************************************************

-FUNCTION-
UnsubscribeEvent: Removes an event subscription.

Use UnsubscribeEvent() to remove an existing event subscription.  A valid handle returned from the ~SubscribeEvent()
function must be provided.

-INPUT-
ptr Handle: An event handle returned from ~SubscribeEvent()
-END-

*********************************************************************************************************************/

void UnsubscribeEvent(APTR Handle)
{
   Log log(__FUNCTION__);

   if (not Handle) return;

   std::lock_guard lock(glmEvents);

   if (not glEventList) return;

   auto event = (eventsub *)Handle;

   log.trace("Handle: %p, %s", event, event->eventName());

   if (event->Prev) event->Prev->Next = event->Next;
   if (event->Next) event->Next->Prev = event->Prev;
   if (event IS glEventList) glEventList = event->Next;

   delete event;

   glEventListAltered = true;
}

} // namespace sift
