// Copyright 2026 The ocrgrab Authors

#include "platform/windows/win_overlay_capture.h"

#ifdef _WIN32

#include <windowsx.h>

#include <algorithm>
#include <utility>
#include <vector>

#include "core/image_io.h"
#include "core/logger.h"

namespace ocrgrab {
namespace internal {

namespace {

constexpr wchar_t kOverlayClassName[] = L"OcrGrabRegionOverlay";
constexpr BYTE kOverlayAlpha = 64;  // 25 % opacity
constexpr int kMinSelectionSide = 2;  // both sides must exceed this
constexpr int kBorderWidth = 2;

}  // namespace

WinOverlayCapture::WinOverlayCapture(std::shared_ptr<spdlog::logger> logger)
    : logger_(std::move(logger)) {}

WinOverlayCapture::~WinOverlayCapture() {
  if (hwnd_) DestroyWindow(hwnd_);
  if (class_registered_) {
    UnregisterClassW(kOverlayClassName, GetModuleHandleW(nullptr));
  }
}

void WinOverlayCapture::EnableDpiAwareness() {
  if (dpi_aware_) return;
  // Physical pixels so the overlay and the GDI grab agree on coordinates.
  using SetProcessDpiAwarenessContextFunc = BOOL(WINAPI*)(HANDLE);
  HMODULE user32 = GetModuleHandleW(L"user32.dll");
  if (user32) {
    auto set_dpi_ctx = reinterpret_cast<SetProcessDpiAwarenessContextFunc>(
        GetProcAddress(user32, "SetProcessDpiAwarenessContext"));
    // DPI_AWARENESS_CONTEXT_PER_MONITOR_AWARE_V2 = ((HANDLE)-4)
    if (set_dpi_ctx &&
        set_dpi_ctx(reinterpret_cast<HANDLE>(static_cast<intptr_t>(-4)))) {
      dpi_aware_ = true;
      return;
    }
  }
  dpi_aware_ = SetProcessDPIAware() != FALSE;
}

bool WinOverlayCapture::RegisterWindowClass() {
  if (class_registered_) return true;

  WNDCLASSEXW wc = {};
  wc.cbSize = sizeof(wc);
  wc.lpfnWndProc = WndProc;
  wc.hInstance = GetModuleHandleW(nullptr);
  wc.hCursor = LoadCursorW(nullptr, IDC_CROSS);
  wc.hbrBackground = static_cast<HBRUSH>(GetStockObject(BLACK_BRUSH));
  wc.lpszClassName = kOverlayClassName;

  if (RegisterClassExW(&wc) == 0) {
    if (GetLastError() != ERROR_CLASS_ALREADY_EXISTS) return false;
  }
  class_registered_ = true;
  return true;
}

RECT WinOverlayCapture::CurrentRect() const {
  RECT r;
  r.left = (std::min)(drag_start_.x, drag_current_.x);
  r.top = (std::min)(drag_start_.y, drag_current_.y);
  r.right = (std::max)(drag_start_.x, drag_current_.x);
  r.bottom = (std::max)(drag_start_.y, drag_current_.y);
  return r;
}

void WinOverlayCapture::OnPaint(HWND hwnd) {
  PAINTSTRUCT ps;
  HDC hdc = BeginPaint(hwnd, &ps);
  RECT client;
  GetClientRect(hwnd, &client);
  FillRect(hdc, &client, static_cast<HBRUSH>(GetStockObject(BLACK_BRUSH)));

  if (dragging_) {
    RECT r = CurrentRect();
    HPEN pen = CreatePen(PS_SOLID, kBorderWidth, RGB(255, 0, 0));
    HGDIOBJ old_pen = SelectObject(hdc, pen);
    HGDIOBJ old_brush = SelectObject(hdc, GetStockObject(NULL_BRUSH));
    Rectangle(hdc, r.left, r.top, r.right, r.bottom);
    SelectObject(hdc, old_brush);
    SelectObject(hdc, old_pen);
    DeleteObject(pen);
  }
  EndPaint(hwnd, &ps);
}

LRESULT CALLBACK WinOverlayCapture::WndProc(HWND hwnd, UINT msg,
                                            WPARAM wparam, LPARAM lparam) {
  WinOverlayCapture* self = nullptr;
  if (msg == WM_NCCREATE) {
    auto* cs = reinterpret_cast<CREATESTRUCT*>(lparam);
    self = static_cast<WinOverlayCapture*>(cs->lpCreateParams);
    SetWindowLongPtrW(hwnd, GWLP_USERDATA, reinterpret_cast<LONG_PTR>(self));
  } else {
    self = reinterpret_cast<WinOverlayCapture*>(
        GetWindowLongPtrW(hwnd, GWLP_USERDATA));
  }
  if (!self) return DefWindowProcW(hwnd, msg, wparam, lparam);

  switch (msg) {
    case WM_PAINT:
      self->OnPaint(hwnd);
      return 0;

    case WM_ERASEBKGND:
      return 1;

    case WM_LBUTTONDOWN:
      self->drag_start_ = {GET_X_LPARAM(lparam), GET_Y_LPARAM(lparam)};
      self->drag_current_ = self->drag_start_;
      self->dragging_ = true;
      SetCapture(hwnd);
      InvalidateRect(hwnd, nullptr, FALSE);
      return 0;

    case WM_MOUSEMOVE:
      if (self->dragging_) {
        self->drag_current_ = {GET_X_LPARAM(lparam), GET_Y_LPARAM(lparam)};
        InvalidateRect(hwnd, nullptr, FALSE);
      }
      return 0;

    case WM_LBUTTONUP:
      if (self->dragging_) {
        self->drag_current_ = {GET_X_LPARAM(lparam), GET_Y_LPARAM(lparam)};
        ReleaseCapture();
        RECT r = self->CurrentRect();
        self->confirmed_ = (r.right - r.left) > kMinSelectionSide &&
                           (r.bottom - r.top) > kMinSelectionSide;
        self->finished_ = true;
      }
      return 0;

    case WM_KEYDOWN:
      if (wparam == VK_ESCAPE) {
        self->confirmed_ = false;
        self->finished_ = true;
      }
      return 0;

    case WM_CLOSE:
      self->confirmed_ = false;
      self->finished_ = true;
      return 0;

    default:
      break;
  }
  return DefWindowProcW(hwnd, msg, wparam, lparam);
}

bool WinOverlayCapture::SelectRegion(RECT* selection, std::string* error) {
  EnableDpiAwareness();
  if (!RegisterWindowClass()) {
    *error = "RegisterClassExW failed, GetLastError=" +
             std::to_string(GetLastError());
    return false;
  }

  int vx = GetSystemMetrics(SM_XVIRTUALSCREEN);
  int vy = GetSystemMetrics(SM_YVIRTUALSCREEN);
  int vw = GetSystemMetrics(SM_CXVIRTUALSCREEN);
  int vh = GetSystemMetrics(SM_CYVIRTUALSCREEN);
  origin_ = {vx, vy};
  dragging_ = false;
  confirmed_ = false;
  finished_ = false;

  hwnd_ = CreateWindowExW(WS_EX_TOPMOST | WS_EX_TOOLWINDOW | WS_EX_LAYERED,
                          kOverlayClassName, L"Select OCR Region", WS_POPUP,
                          vx, vy, vw, vh, nullptr, nullptr,
                          GetModuleHandleW(nullptr), this);
  if (!hwnd_) {
    *error = "CreateWindowExW failed, GetLastError=" +
             std::to_string(GetLastError());
    return false;
  }
  SetLayeredWindowAttributes(hwnd_, 0, kOverlayAlpha, LWA_ALPHA);
  ShowWindow(hwnd_, SW_SHOW);
  SetForegroundWindow(hwnd_);
  SetFocus(hwnd_);

  MSG msg;
  while (!finished_) {
    BOOL got = GetMessageW(&msg, nullptr, 0, 0);
    if (got == 0 || got == -1) break;
    TranslateMessage(&msg);
    DispatchMessageW(&msg);
  }

  RECT r = CurrentRect();
  DestroyWindow(hwnd_);
  hwnd_ = nullptr;
  // Let the compositor remove the overlay before the screen is read.
  while (PeekMessageW(&msg, nullptr, 0, 0, PM_REMOVE)) {
    TranslateMessage(&msg);
    DispatchMessageW(&msg);
  }
  Sleep(100);

  if (!confirmed_) return false;
  selection->left = r.left + origin_.x;
  selection->top = r.top + origin_.y;
  selection->right = r.right + origin_.x;
  selection->bottom = r.bottom + origin_.y;
  return true;
}

std::unique_ptr<Image> WinOverlayCapture::GrabScreenRect(const RECT& rect) {
  int width = rect.right - rect.left;
  int height = rect.bottom - rect.top;

  HDC screen_dc = GetDC(nullptr);
  if (!screen_dc) return nullptr;
  HDC mem_dc = CreateCompatibleDC(screen_dc);
  if (!mem_dc) {
    ReleaseDC(nullptr, screen_dc);
    return nullptr;
  }
  HBITMAP bitmap = CreateCompatibleBitmap(screen_dc, width, height);
  if (!bitmap) {
    DeleteDC(mem_dc);
    ReleaseDC(nullptr, screen_dc);
    return nullptr;
  }

  HGDIOBJ old_obj = SelectObject(mem_dc, bitmap);
  BOOL blitted = BitBlt(mem_dc, 0, 0, width, height, screen_dc, rect.left,
                        rect.top, SRCCOPY | CAPTUREBLT);
  SelectObject(mem_dc, old_obj);

  BITMAPINFOHEADER bmi = {};
  bmi.biSize = sizeof(bmi);
  bmi.biWidth = width;
  bmi.biHeight = -height;  // Top-down.
  bmi.biPlanes = 1;
  bmi.biBitCount = 32;
  bmi.biCompression = BI_RGB;

  int stride = width * 4;
  std::vector<uint8_t> data(static_cast<size_t>(stride) * height);
  int lines = blitted ? GetDIBits(mem_dc, bitmap, 0, height, data.data(),
                                  reinterpret_cast<BITMAPINFO*>(&bmi),
                                  DIB_RGB_COLORS)
                      : 0;

  DeleteObject(bitmap);
  DeleteDC(mem_dc);
  ReleaseDC(nullptr, screen_dc);
  if (lines != height) return nullptr;

  // GDI leaves alpha at 0.
  for (size_t i = 3; i < data.size(); i += 4) data[i] = 0xFF;

  return Image::CreateFromData(width, height, stride, PixelFormat::kBgra8,
                               std::move(data));
}

CaptureOutcome WinOverlayCapture::Capture(const std::string& output_path) {
  CaptureOutcome outcome;
  SPDLOG_LOGGER_INFO(logger_, "Please select region on screen...");

  RECT selection = {};
  std::string error;
  if (!SelectRegion(&selection, &error)) {
    if (!error.empty()) {
      outcome.status = CaptureStatus::kUnavailable;
      outcome.message = error;
    } else {
      outcome.status = CaptureStatus::kCancelled;
    }
    return outcome;
  }

  std::unique_ptr<Image> image = GrabScreenRect(selection);
  if (!image) {
    outcome.status = CaptureStatus::kUnavailable;
    outcome.message = "Failed to read screen pixels";
    return outcome;
  }
  if (!WritePng(*image, output_path, &error)) {
    outcome.status = CaptureStatus::kUnavailable;
    outcome.message = error;
    return outcome;
  }
  outcome.status = CaptureStatus::kCaptured;
  return outcome;
}

}  // namespace internal
}  // namespace ocrgrab

#endif  // _WIN32
