#pragma once
#ifdef _WIN32
#include <windows.h>
#include <objbase.h>
#include <oleauto.h>
#include <string>

namespace uiscope {

template <typename T>
class ComPtr {
public:
    ComPtr() : ptr_(nullptr) {}
    ComPtr(T* p) : ptr_(p) { if (ptr_) ptr_->AddRef(); }
    ~ComPtr() { reset(); }

    ComPtr(const ComPtr& other) : ptr_(other.ptr_) { if (ptr_) ptr_->AddRef(); }
    ComPtr& operator=(const ComPtr& other) {
        if (this != &other) {
            reset();
            ptr_ = other.ptr_;
            if (ptr_) ptr_->AddRef();
        }
        return *this;
    }
    ComPtr(ComPtr&& other) noexcept : ptr_(other.ptr_) { other.ptr_ = nullptr; }
    ComPtr& operator=(ComPtr&& other) noexcept {
        if (this != &other) {
            reset();
            ptr_ = other.ptr_;
            other.ptr_ = nullptr;
        }
        return *this;
    }

    T* operator->() const { return ptr_; }
    // Out-parameter access; drops whatever was held before.
    T** operator&() { reset(); return &ptr_; }
    operator T*() const { return ptr_; }
    T* get() const { return ptr_; }

    void reset() {
        if (ptr_) {
            ptr_->Release();
            ptr_ = nullptr;
        }
    }

    bool operator!() const { return ptr_ == nullptr; }

private:
    T* ptr_;
};

class ScopedVariant {
public:
    ScopedVariant() { VariantInit(&v_); }
    ~ScopedVariant() { VariantClear(&v_); }
    ScopedVariant(const ScopedVariant&) = delete;
    ScopedVariant& operator=(const ScopedVariant&) = delete;

    VARIANT* operator&() { VariantClear(&v_); return &v_; }
    const VARIANT& get() const { return v_; }
    VARTYPE type() const { return v_.vt; }
    bool empty() const { return v_.vt == VT_EMPTY || v_.vt == VT_NULL; }

private:
    VARIANT v_;
};

class ScopedBstr {
public:
    ScopedBstr() = default;
    ~ScopedBstr() { if (b_) SysFreeString(b_); }
    ScopedBstr(const ScopedBstr&) = delete;
    ScopedBstr& operator=(const ScopedBstr&) = delete;

    BSTR* operator&() {
        if (b_) { SysFreeString(b_); b_ = nullptr; }
        return &b_;
    }
    BSTR get() const { return b_; }

private:
    BSTR b_ = nullptr;
};

inline std::string w2u8(const wchar_t* s, int len) {
    if (!s || len <= 0)
        return {};
    int n = WideCharToMultiByte(CP_UTF8, 0, s, len, nullptr, 0, nullptr, nullptr);
    std::string out(n, '\0');
    WideCharToMultiByte(CP_UTF8, 0, s, len, out.data(), n, nullptr, nullptr);
    return out;
}

inline std::string bstr_to_utf8(BSTR b) {
    if (!b)
        return {};
    return w2u8(b, (int)SysStringLen(b));
}

} // namespace uiscope
#endif
