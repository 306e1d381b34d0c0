#pragma once

// Contract: call once from setup().
void appSetup();

// Contract: call from loop(); never blocks except while the WiFi captive portal is open.
void appLoop();
