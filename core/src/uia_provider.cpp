#include "uiscope/uia_provider.hpp"
#include "uiscope/cache_request.hpp"
#include "uiscope/errors.hpp"
#include "uiscope/logger.hpp"

#ifdef _WIN32
#define WIN32_LEAN_AND_MEAN
#include <windows.h>
#include <UIAutomation.h>
#include <map>
#include <sstream>
#include "uiscope/util_win32.hpp"

namespace uiscope {

namespace {

constexpr HRESULT HR_ELEMENT_NOT_AVAILABLE = (HRESULT)0x80040201L;
constexpr HRESULT HR_UIA_TIMEOUT = (HRESULT)0x80131505L;

HWND from_u64(hwnd_u64 h) {
  return reinterpret_cast<HWND>(static_cast<std::uintptr_t>(h));
}

std::string hr_text(HRESULT hr) {
  std::ostringstream ss;
  ss << "0x" << std::hex << std::uppercase << (unsigned long)hr;
  return ss.str();
}

bool is_disconnect(HRESULT hr) {
  return hr == RPC_E_DISCONNECTED || hr == HRESULT_FROM_WIN32(RPC_S_SERVER_UNAVAILABLE) ||
         hr == HRESULT_FROM_WIN32(RPC_S_CALL_FAILED) || hr == CO_E_OBJNOTCONNECTED;
}

// Stale and timeout conditions are recoverable everywhere; anything else
// means the provider refused the fetch.
[[noreturn]] void throw_fetch_error(HRESULT hr, const char *op) {
  std::string msg = std::string(op) + " failed: " + hr_text(hr);
  if (hr == HR_ELEMENT_NOT_AVAILABLE || is_disconnect(hr))
    throw ElementStale(msg);
  if (hr == HR_UIA_TIMEOUT)
    throw FetchTimeout(msg);
  throw FetchRejected(msg);
}

[[noreturn]] void throw_read_error(HRESULT hr, const char *op) {
  std::string msg = std::string(op) + " failed: " + hr_text(hr);
  if (hr == HR_UIA_TIMEOUT)
    throw FetchTimeout(msg);
  throw ElementStale(msg);
}

PROPERTYID property_id(Property p) {
  switch (p) {
  case Property::ControlType: return UIA_ControlTypePropertyId;
  case Property::LocalizedControlType: return UIA_LocalizedControlTypePropertyId;
  case Property::Name: return UIA_NamePropertyId;
  case Property::AutomationId: return UIA_AutomationIdPropertyId;
  case Property::ClassName: return UIA_ClassNamePropertyId;
  case Property::BoundingRectangle: return UIA_BoundingRectanglePropertyId;
  case Property::IsEnabled: return UIA_IsEnabledPropertyId;
  case Property::IsOffscreen: return UIA_IsOffscreenPropertyId;
  case Property::IsControlElement: return UIA_IsControlElementPropertyId;
  case Property::HasKeyboardFocus: return UIA_HasKeyboardFocusPropertyId;
  case Property::IsKeyboardFocusable: return UIA_IsKeyboardFocusablePropertyId;
  case Property::AcceleratorKey: return UIA_AcceleratorKeyPropertyId;
  case Property::ValueValue: return UIA_ValueValuePropertyId;
  case Property::LegacyRole: return UIA_LegacyIAccessibleRolePropertyId;
  case Property::LegacyValue: return UIA_LegacyIAccessibleValuePropertyId;
  case Property::LegacyDefaultAction: return UIA_LegacyIAccessibleDefaultActionPropertyId;
  case Property::ToggleState: return UIA_ToggleToggleStatePropertyId;
  case Property::ScrollHorizontallyScrollable: return UIA_ScrollHorizontallyScrollablePropertyId;
  case Property::ScrollVerticallyScrollable: return UIA_ScrollVerticallyScrollablePropertyId;
  case Property::ScrollHorizontalPercent: return UIA_ScrollHorizontalScrollPercentPropertyId;
  case Property::ScrollVerticalPercent: return UIA_ScrollVerticalScrollPercentPropertyId;
  case Property::ScrollHorizontalViewSize: return UIA_ScrollHorizontalViewSizePropertyId;
  case Property::ScrollVerticalViewSize: return UIA_ScrollVerticalViewSizePropertyId;
  case Property::IsInvokePatternAvailable: return UIA_IsInvokePatternAvailablePropertyId;
  case Property::IsValuePatternAvailable: return UIA_IsValuePatternAvailablePropertyId;
  case Property::IsTogglePatternAvailable: return UIA_IsTogglePatternAvailablePropertyId;
  case Property::IsScrollPatternAvailable: return UIA_IsScrollPatternAvailablePropertyId;
  case Property::IsExpandCollapsePatternAvailable: return UIA_IsExpandCollapsePatternAvailablePropertyId;
  case Property::IsSelectionItemPatternAvailable: return UIA_IsSelectionItemPatternAvailablePropertyId;
  case Property::IsLegacyIAccessiblePatternAvailable: return UIA_IsLegacyIAccessiblePatternAvailablePropertyId;
  }
  return UIA_NamePropertyId;
}

ToggleState from_uia(::ToggleState s) {
  switch (s) {
  case ToggleState_On: return ToggleState::On;
  case ToggleState_Indeterminate: return ToggleState::Indeterminate;
  default: return ToggleState::Off;
  }
}

class UiaConnection final : public IConnection {
public:
  explicit UiaConnection(ComPtr<IUIAutomation> automation)
      : automation_(std::move(automation)) {}

  std::unique_ptr<IElement> element_from_window(hwnd_u64 hwnd) override;

  IUIAutomationCacheRequest *request_for(const CacheRequest &req) {
    auto it = requests_.find(req.scope);
    if (it != requests_.end())
      return it->second.get();

    ComPtr<IUIAutomationCacheRequest> cr;
    HRESULT hr = automation_->CreateCacheRequest(&cr);
    if (FAILED(hr) || !cr)
      throw FetchRejected("CreateCacheRequest failed: " + hr_text(hr));
    for (Property p : req.properties) {
      hr = cr->AddProperty(property_id(p));
      if (FAILED(hr))
        throw FetchRejected("AddProperty failed: " + hr_text(hr));
    }
    hr = cr->put_TreeScope(static_cast<::TreeScope>(req.scope));
    if (FAILED(hr))
      throw FetchRejected("put_TreeScope failed: " + hr_text(hr));
    IUIAutomationCacheRequest *raw = cr.get();
    requests_.emplace(req.scope, std::move(cr));
    return raw;
  }

private:
  ComPtr<IUIAutomation> automation_;
  std::map<TreeScope, ComPtr<IUIAutomationCacheRequest>> requests_;
};

class UiaElement final : public IElement {
public:
  UiaElement(ComPtr<IUIAutomationElement> el, UiaConnection *conn)
      : el_(std::move(el)), conn_(conn) {}

  RawNode read() override {
    RawNode r;
    CONTROLTYPEID ct = 0;
    HRESULT hr = el_->get_CachedControlType(&ct);
    if (FAILED(hr))
      throw_read_error(hr, "get_CachedControlType");
    r.control_type = ct;

    r.localized_control_type = cached_str(&IUIAutomationElement::get_CachedLocalizedControlType);
    r.name = cached_str(&IUIAutomationElement::get_CachedName);
    r.automation_id = cached_str(&IUIAutomationElement::get_CachedAutomationId);
    r.class_name = cached_str(&IUIAutomationElement::get_CachedClassName);
    r.accelerator_key = cached_str(&IUIAutomationElement::get_CachedAcceleratorKey);

    RECT rc{};
    if (SUCCEEDED(el_->get_CachedBoundingRectangle(&rc)))
      r.bounding_rect = Rect{rc.left, rc.top, rc.right, rc.bottom};

    r.is_enabled = cached_flag(&IUIAutomationElement::get_CachedIsEnabled);
    r.is_offscreen = cached_flag(&IUIAutomationElement::get_CachedIsOffscreen);
    r.is_control_element = cached_flag(&IUIAutomationElement::get_CachedIsControlElement);
    r.has_keyboard_focus = cached_flag(&IUIAutomationElement::get_CachedHasKeyboardFocus);
    r.is_keyboard_focusable = cached_flag(&IUIAutomationElement::get_CachedIsKeyboardFocusable);

    struct { PROPERTYID id; Pattern p; } avail[] = {
        {UIA_IsInvokePatternAvailablePropertyId, Pattern::Invoke},
        {UIA_IsValuePatternAvailablePropertyId, Pattern::Value},
        {UIA_IsTogglePatternAvailablePropertyId, Pattern::Toggle},
        {UIA_IsScrollPatternAvailablePropertyId, Pattern::Scroll},
        {UIA_IsExpandCollapsePatternAvailablePropertyId, Pattern::ExpandCollapse},
        {UIA_IsSelectionItemPatternAvailablePropertyId, Pattern::SelectionItem},
        {UIA_IsLegacyIAccessiblePatternAvailablePropertyId, Pattern::LegacyIAccessible},
    };
    for (const auto &a : avail) {
      if (prop_bool(a.id).value_or(false))
        r.patterns.set(a.p);
    }

    if (r.patterns.has(Pattern::Scroll)) {
      auto hs = prop_bool(UIA_ScrollHorizontallyScrollablePropertyId);
      auto vs = prop_bool(UIA_ScrollVerticallyScrollablePropertyId);
      auto hp = prop_double(UIA_ScrollHorizontalScrollPercentPropertyId);
      auto vp = prop_double(UIA_ScrollVerticalScrollPercentPropertyId);
      if (hs && vs && hp && vp) {
        ScrollInfo s;
        s.horizontally_scrollable = *hs;
        s.vertically_scrollable = *vs;
        s.horizontal_percent = *hp;
        s.vertical_percent = *vp;
        s.horizontal_view_size = prop_double(UIA_ScrollHorizontalViewSizePropertyId).value_or(100);
        s.vertical_view_size = prop_double(UIA_ScrollVerticalViewSizePropertyId).value_or(100);
        r.scroll = s;
        r.patterns.scroll_range = s.has_range();
      }
    }
    if (r.patterns.has(Pattern::Value))
      r.value = prop_str(UIA_ValueValuePropertyId);
    if (r.patterns.has(Pattern::LegacyIAccessible)) {
      auto role = prop_int(UIA_LegacyIAccessibleRolePropertyId);
      if (role) {
        LegacyInfo l;
        l.role = (std::uint32_t)*role;
        l.value = prop_str(UIA_LegacyIAccessibleValuePropertyId).value_or("");
        l.default_action = prop_str(UIA_LegacyIAccessibleDefaultActionPropertyId).value_or("");
        r.legacy = l;
      }
    }
    if (r.patterns.has(Pattern::Toggle)) {
      if (auto t = prop_int(UIA_ToggleToggleStatePropertyId))
        r.toggle = from_uia((::ToggleState)*t);
    }
    return r;
  }

  std::unique_ptr<IElement> build_cache(const CacheRequest &req) override {
    ComPtr<IUIAutomationElement> out;
    HRESULT hr = el_->BuildUpdatedCache(conn_->request_for(req), &out);
    if (FAILED(hr) || !out)
      throw_fetch_error(hr, "BuildUpdatedCache");
    return std::make_unique<UiaElement>(std::move(out), conn_);
  }

  std::vector<std::unique_ptr<IElement>> cached_children() override {
    std::vector<std::unique_ptr<IElement>> out;
    ComPtr<IUIAutomationElementArray> arr;
    HRESULT hr = el_->GetCachedChildren(&arr);
    if (FAILED(hr))
      throw_read_error(hr, "GetCachedChildren");
    // A null array means no children.
    if (!arr)
      return out;
    int len = 0;
    hr = arr->get_Length(&len);
    if (FAILED(hr))
      throw_read_error(hr, "get_Length");
    out.reserve((size_t)len);
    for (int i = 0; i < len; ++i) {
      ComPtr<IUIAutomationElement> child;
      if (SUCCEEDED(arr->GetElement(i, &child)) && child)
        out.push_back(std::make_unique<UiaElement>(std::move(child), conn_));
    }
    return out;
  }

  std::optional<Rect> query_bounding_rect() override {
    RECT rc{};
    HRESULT hr = el_->get_CurrentBoundingRectangle(&rc);
    if (FAILED(hr))
      throw_read_error(hr, "get_CurrentBoundingRectangle");
    return Rect{rc.left, rc.top, rc.right, rc.bottom};
  }

  std::optional<ScrollInfo> query_scroll() override {
    ComPtr<IUIAutomationScrollPattern> p;
    if (!pattern(UIA_ScrollPatternId, __uuidof(IUIAutomationScrollPattern), (void **)&p))
      return std::nullopt;
    ScrollInfo s;
    BOOL b = FALSE;
    if (SUCCEEDED(p->get_CurrentHorizontallyScrollable(&b)))
      s.horizontally_scrollable = b != FALSE;
    if (SUCCEEDED(p->get_CurrentVerticallyScrollable(&b)))
      s.vertically_scrollable = b != FALSE;
    p->get_CurrentHorizontalScrollPercent(&s.horizontal_percent);
    p->get_CurrentVerticalScrollPercent(&s.vertical_percent);
    p->get_CurrentHorizontalViewSize(&s.horizontal_view_size);
    p->get_CurrentVerticalViewSize(&s.vertical_view_size);
    return s;
  }

  std::optional<std::string> query_value() override {
    ComPtr<IUIAutomationValuePattern> p;
    if (!pattern(UIA_ValuePatternId, __uuidof(IUIAutomationValuePattern), (void **)&p))
      return std::nullopt;
    ScopedBstr b;
    HRESULT hr = p->get_CurrentValue(&b);
    if (FAILED(hr))
      throw_read_error(hr, "ValuePattern.get_CurrentValue");
    return bstr_to_utf8(b.get());
  }

  std::optional<LegacyInfo> query_legacy() override {
    ComPtr<IUIAutomationLegacyIAccessiblePattern> p;
    if (!pattern(UIA_LegacyIAccessiblePatternId,
                 __uuidof(IUIAutomationLegacyIAccessiblePattern), (void **)&p))
      return std::nullopt;
    LegacyInfo l;
    DWORD role = 0;
    if (SUCCEEDED(p->get_CurrentRole(&role)))
      l.role = role;
    ScopedBstr v;
    if (SUCCEEDED(p->get_CurrentValue(&v)))
      l.value = bstr_to_utf8(v.get());
    ScopedBstr a;
    if (SUCCEEDED(p->get_CurrentDefaultAction(&a)))
      l.default_action = bstr_to_utf8(a.get());
    return l;
  }

  std::optional<ToggleState> query_toggle() override {
    ComPtr<IUIAutomationTogglePattern> p;
    if (!pattern(UIA_TogglePatternId, __uuidof(IUIAutomationTogglePattern), (void **)&p))
      return std::nullopt;
    ::ToggleState s = ToggleState_Off;
    HRESULT hr = p->get_CurrentToggleState(&s);
    if (FAILED(hr))
      throw_read_error(hr, "TogglePattern.get_CurrentToggleState");
    return from_uia(s);
  }

private:
  using StrGetter = HRESULT (STDMETHODCALLTYPE IUIAutomationElement::*)(BSTR *);
  using FlagGetter = HRESULT (STDMETHODCALLTYPE IUIAutomationElement::*)(BOOL *);

  std::string cached_str(StrGetter g) {
    ScopedBstr b;
    if (FAILED((el_.get()->*g)(&b)))
      return {};
    return bstr_to_utf8(b.get());
  }

  bool cached_flag(FlagGetter g) {
    BOOL b = FALSE;
    if (FAILED((el_.get()->*g)(&b)))
      return false;
    return b != FALSE;
  }

  bool cached_prop(PROPERTYID id, ScopedVariant &v) {
    return SUCCEEDED(el_->GetCachedPropertyValue(id, &v)) && !v.empty();
  }

  std::optional<bool> prop_bool(PROPERTYID id) {
    ScopedVariant v;
    if (!cached_prop(id, v) || v.type() != VT_BOOL)
      return std::nullopt;
    return v.get().boolVal != VARIANT_FALSE;
  }

  std::optional<double> prop_double(PROPERTYID id) {
    ScopedVariant v;
    if (!cached_prop(id, v) || v.type() != VT_R8)
      return std::nullopt;
    return v.get().dblVal;
  }

  std::optional<long> prop_int(PROPERTYID id) {
    ScopedVariant v;
    if (!cached_prop(id, v) || v.type() != VT_I4)
      return std::nullopt;
    return v.get().lVal;
  }

  std::optional<std::string> prop_str(PROPERTYID id) {
    ScopedVariant v;
    if (!cached_prop(id, v) || v.type() != VT_BSTR)
      return std::nullopt;
    return bstr_to_utf8(v.get().bstrVal);
  }

  // False when the element does not support the pattern.
  bool pattern(PATTERNID id, REFIID iid, void **out) {
    HRESULT hr = el_->GetCurrentPatternAs(id, iid, out);
    if (FAILED(hr))
      throw_read_error(hr, "GetCurrentPatternAs");
    return *out != nullptr;
  }

  ComPtr<IUIAutomationElement> el_;
  UiaConnection *conn_;
};

std::unique_ptr<IElement> UiaConnection::element_from_window(hwnd_u64 hwnd) {
  HWND h = from_u64(hwnd);
  if (!IsWindow(h))
    throw ConnectionUnavailable(Hwnd(hwnd).to_string() + " is not a window");
  ComPtr<IUIAutomationElement> el;
  HRESULT hr = automation_->ElementFromHandle(h, &el);
  if (hr == HR_ELEMENT_NOT_AVAILABLE)
    throw ElementStale("ElementFromHandle: element not available");
  if (hr == HR_UIA_TIMEOUT)
    throw FetchTimeout("ElementFromHandle timed out");
  if (FAILED(hr) || !el)
    throw ConnectionUnavailable("ElementFromHandle failed for " +
                                Hwnd(hwnd).to_string() + ": " + hr_text(hr));
  return std::make_unique<UiaElement>(std::move(el), this);
}

} // namespace

UiaProvider::UiaProvider(ProviderConfig cfg) : cfg_(cfg) {}

ThreadInit UiaProvider::enter_thread() {
  HRESULT hr = CoInitializeEx(nullptr, COINIT_MULTITHREADED);
  if (hr == RPC_E_CHANGED_MODE) {
    LOG_WARN("COM already initialised in another apartment on this thread; "
             "using it as-is");
    return ThreadInit{false};
  }
  if (FAILED(hr))
    throw ConnectionUnavailable("CoInitializeEx failed: " + hr_text(hr));
  // S_FALSE still needs a balancing CoUninitialize.
  return ThreadInit{true};
}

void UiaProvider::leave_thread() { CoUninitialize(); }

std::unique_ptr<IConnection> UiaProvider::connect() {
  ComPtr<IUIAutomation> automation;
  HRESULT hr = CoCreateInstance(CLSID_CUIAutomation, nullptr, CLSCTX_INPROC_SERVER,
                                IID_IUIAutomation, (void **)&automation);
  if (FAILED(hr) || !automation)
    throw ConnectionUnavailable("CoCreateInstance(CUIAutomation) failed: " + hr_text(hr));

  if (cfg_.transaction_timeout_ms || cfg_.connection_timeout_ms) {
    ComPtr<IUIAutomation2> automation2;
    hr = automation->QueryInterface(__uuidof(IUIAutomation2), (void **)&automation2);
    if (SUCCEEDED(hr) && automation2) {
      if (cfg_.transaction_timeout_ms)
        automation2->put_TransactionTimeout(cfg_.transaction_timeout_ms);
      if (cfg_.connection_timeout_ms)
        automation2->put_ConnectionTimeout(cfg_.connection_timeout_ms);
    } else {
      LOG_DEBUG("IUIAutomation2 unavailable, provider timeouts not applied");
    }
  }
  return std::make_unique<UiaConnection>(std::move(automation));
}

ProviderCapabilities UiaProvider::probe() {
  ProviderCapabilities caps;
  caps.description = "Windows UI Automation";
  HMODULE ntdll = GetModuleHandleW(L"ntdll.dll");
  if (ntdll) {
    using wine_get_version_fn = const char *(__cdecl *)();
    auto fn = reinterpret_cast<wine_get_version_fn>(
        GetProcAddress(ntdll, "wine_get_version"));
    if (fn) {
      caps.is_wine = true;
      // Wine's UIA does not implement subtree caching reliably.
      caps.subtree_cache = false;
      caps.description = std::string("Wine ") + fn() + " UI Automation";
    }
  }
  return caps;
}

} // namespace uiscope
#else
namespace uiscope {

UiaProvider::UiaProvider(ProviderConfig cfg) : cfg_(cfg) {}

ThreadInit UiaProvider::enter_thread() { return ThreadInit{false}; }
void UiaProvider::leave_thread() {}

std::unique_ptr<IConnection> UiaProvider::connect() {
  throw ConnectionUnavailable("UI Automation is only available on Windows");
}

ProviderCapabilities UiaProvider::probe() {
  ProviderCapabilities caps;
  caps.subtree_cache = false;
  caps.description = "no accessibility provider on this platform";
  return caps;
}

} // namespace uiscope
#endif
