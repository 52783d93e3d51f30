#ifndef USBDRIVERHELPER_H
#define USBDRIVERHELPER_H

#include <QString>

/**
 * @brief UsbDriverHelper - locate and launch Zadig for the WinUSB driver
 *
 * Only meaningful on Windows; elsewhere findZadig() is always empty.
 */
namespace UsbDriverHelper {

// <toolsDir>/windows/zadig-2.9.exe, then <toolsDir>/windows/zadig.exe
QString findZadig(const QString& toolsDir);

bool isWindows11();

// Elevated launch on Windows, detached start elsewhere
bool launchZadig(const QString& path);

QString installInstructions();
QString restoreInstructions();

} // namespace UsbDriverHelper

#endif // USBDRIVERHELPER_H
